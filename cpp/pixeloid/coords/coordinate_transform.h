#pragma once

#include "pixeloid/core/types.h"

// Conversions between the three coordinate spaces. Every function depends only
// on the two navigation scalars passed in: the cell size in device pixels and
// the pan offset in world units. One world unit is one cell.
namespace pixeloid {

WorldPoint screenToWorld(const ScreenPoint& s, double cellSizePx, const WorldPoint& panOffset);
ScreenPoint worldToScreen(const WorldPoint& w, double cellSizePx, const WorldPoint& panOffset);
CellPoint worldToCell(const WorldPoint& w);
CellPoint screenToCell(const ScreenPoint& s, double cellSizePx, const WorldPoint& panOffset);

// Top-left corner of a cell.
WorldPoint cellToWorld(const CellPoint& c);
WorldPoint cellCenter(const CellPoint& c);

// Screen length to world length at the given cell size (pick tolerances etc).
inline double screenLengthToWorld(double px, double cellSizePx) {
    return px / cellSizePx;
}

} // namespace pixeloid
