#pragma once

#include "pixeloid/core/types.h"
#include <cstdint>

// Nine canonical positions inside a cell, used to snap authored points.
enum class AnchorPoint : std::uint8_t {
    TopLeft = 0,
    TopMid = 1,
    TopRight = 2,
    LeftMid = 3,
    Center = 4,
    RightMid = 5,
    BottomLeft = 6,
    BottomMid = 7,
    BottomRight = 8,
};

namespace pixeloid {

// Snaps a world point to the given anchor of the cell containing it.
WorldPoint snapToAnchor(const WorldPoint& p, AnchorPoint anchor);

// Offset of the anchor from its cell's top-left corner, in cells.
WorldPoint anchorOffset(AnchorPoint anchor);

const char* anchorPointName(AnchorPoint anchor);

} // namespace pixeloid
