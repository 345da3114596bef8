#pragma once

#include "pixeloid/geometry/shape_params.h"

// Read-only figures derived from canonical parameters for property panels.
// Fields that do not apply to a kind stay zero.
struct ShapeMetrics {
    ShapeKind kind;
    double length;        // line
    double angleDeg;      // line, atan2(dy, dx) in degrees
    WorldPoint midpoint;  // line midpoint, otherwise the center
    double diameter;      // circle
    double circumference; // circle
    double area;          // circle, rectangle, diamond
    double perimeter;     // rectangle, diamond
};

namespace pixeloid {

ShapeMetrics computeMetrics(const ShapeParameters& params);

} // namespace pixeloid
