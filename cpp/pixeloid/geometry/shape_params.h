#ifndef PIXELOID_GEOMETRY_SHAPE_PARAMS_H
#define PIXELOID_GEOMETRY_SHAPE_PARAMS_H

#include "pixeloid/core/types.h"
#include <variant>

// Canonical authored parameters. These are authoritative: vertices and bounds
// are always regenerated from them.

struct PointParams {
    WorldPoint center;
};

struct LineParams {
    WorldPoint start;
    WorldPoint end;
};

struct CircleParams {
    WorldPoint center;
    double radius;
};

struct RectangleParams {
    WorldPoint center;
    double width;
    double height;
};

// Axis-aligned rhombus through four cardinal points.
struct DiamondParams {
    WorldPoint center;
    double width;
    double height;
};

inline bool operator==(const PointParams& a, const PointParams& b) { return a.center == b.center; }
inline bool operator==(const LineParams& a, const LineParams& b) { return a.start == b.start && a.end == b.end; }
inline bool operator==(const CircleParams& a, const CircleParams& b) { return a.center == b.center && a.radius == b.radius; }
inline bool operator==(const RectangleParams& a, const RectangleParams& b) {
    return a.center == b.center && a.width == b.width && a.height == b.height;
}
inline bool operator==(const DiamondParams& a, const DiamondParams& b) {
    return a.center == b.center && a.width == b.width && a.height == b.height;
}

// Alternative order matches ShapeKind (Point first).
using ShapeParameters = std::variant<PointParams, LineParams, CircleParams, RectangleParams, DiamondParams>;

namespace pixeloid {

inline ShapeKind kindOf(const ShapeParameters& params) {
    return static_cast<ShapeKind>(params.index() + 1);
}

} // namespace pixeloid

#endif // PIXELOID_GEOMETRY_SHAPE_PARAMS_H
