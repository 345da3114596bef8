#pragma once

#include "pixeloid/geometry/shape_params.h"
#include "pixeloid/interaction/interaction_constants.h"
#include <cstddef>
#include <cstdint>

namespace pixeloid {

// The only path from an edited vertex back to canonical parameters. Each kind
// uses an exact relationship against a fixed anchor; nothing is fitted from the
// full vertex list.
//
//   Point      center = newPoint
//   Line       index 0 moves start, index 1 moves end
//   Circle     any sample is a radius handle: radius = |newPoint - center|,
//              center never changes
//   Rectangle  the diagonally opposite corner stays fixed; width, height and
//              center follow from the two extremes
//   Diamond    W/E move the horizontal extreme against the opposite one
//              (center.x and width only); N/S do the same vertically
//
// Circle and diamond handles project: the regenerated vertex keeps its angle
// (circle) or its axis (diamond) and only lands on newPoint when newPoint
// already lies there.
//
// Moving a vertex onto its current generated position returns oldParams
// unchanged. Returns InvalidParameters for a non-finite point and
// DegenerateEdit when the edit collapses the shape. `out` is only written on Ok.
//
// Throws std::out_of_range when vertexIndex is not a vertex of the shape.
ObjectError deriveFromVertexEdit(
    const ShapeParameters& oldParams,
    std::size_t vertexIndex,
    const WorldPoint& newPoint,
    ShapeParameters& out,
    std::uint32_t circleSegments = interaction_constants::DEFAULT_CIRCLE_SEGMENTS);

} // namespace pixeloid
