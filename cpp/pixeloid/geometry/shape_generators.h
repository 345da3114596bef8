#ifndef PIXELOID_GEOMETRY_SHAPE_GENERATORS_H
#define PIXELOID_GEOMETRY_SHAPE_GENERATORS_H

#include "pixeloid/geometry/shape_params.h"
#include "pixeloid/interaction/interaction_constants.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace pixeloid {

// Parameters -> vertices. Deterministic and total for valid parameters.
//   Point:     [center]
//   Line:      [start, end]
//   Circle:    N samples, sample i at angle 2*pi*i/N (index 0 is East)
//   Rectangle: TL, TR, BR, BL (y grows downwards)
//   Diamond:   W, N, E, S
std::vector<WorldPoint> generateVertices(
    const ShapeParameters& params,
    std::uint32_t circleSegments = interaction_constants::DEFAULT_CIRCLE_SEGMENTS);

// Number of vertices generateVertices would produce.
std::size_t vertexCount(
    const ShapeParameters& params,
    std::uint32_t circleSegments = interaction_constants::DEFAULT_CIRCLE_SEGMENTS);

// min/max over vertices. An empty list yields an all-zero box.
AABB computeBounds(const std::vector<WorldPoint>& vertices);

// Ok, or InvalidParameters for non-finite values or non-positive sizes.
ObjectError validateParameters(const ShapeParameters& params);

// Every WorldPoint field shifted by delta; sizes untouched.
ShapeParameters translateParameters(const ShapeParameters& params, const WorldPoint& delta);

} // namespace pixeloid

#endif // PIXELOID_GEOMETRY_SHAPE_GENERATORS_H
