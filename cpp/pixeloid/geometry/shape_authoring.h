#pragma once

#include "pixeloid/geometry/shape_params.h"
#include "pixeloid/core/config.h"

namespace pixeloid {

// Builds canonical parameters from the two points of a drawing gesture.
//   Point      at `current`
//   Line       first -> current
//   Circle     centred on the midpoint, radius half the distance
//   Rectangle  spanning both corners
//   Diamond    `first` is the West vertex, width from the horizontal drag,
//              isometric height width * DIAMOND_ISOMETRIC_RATIO
// The result is not validated; a zero-size drag yields zero sizes.
ShapeParameters parametersFromDrag(ShapeKind kind, const WorldPoint& first, const WorldPoint& current);

// Applies the per-kind anchor snap from DrawingSettings when enabled.
WorldPoint snapAuthoringPoint(const WorldPoint& p, ShapeKind kind, const DrawingSettings& settings);

} // namespace pixeloid
