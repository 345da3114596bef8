#include "pixeloid/geometry/shape_metrics.h"
#include <cmath>
#include <type_traits>

namespace pixeloid {

namespace {
    constexpr double kPi = 3.14159265358979323846264338327950;
}

ShapeMetrics computeMetrics(const ShapeParameters& params) {
    ShapeMetrics m{};
    m.kind = kindOf(params);
    std::visit([&](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, PointParams>) {
            m.midpoint = p.center;
        } else if constexpr (std::is_same_v<T, LineParams>) {
            const double dx = p.end.x - p.start.x;
            const double dy = p.end.y - p.start.y;
            m.length = std::hypot(dx, dy);
            m.angleDeg = std::atan2(dy, dx) * 180.0 / kPi;
            m.midpoint = {(p.start.x + p.end.x) * 0.5, (p.start.y + p.end.y) * 0.5};
        } else if constexpr (std::is_same_v<T, CircleParams>) {
            m.midpoint = p.center;
            m.diameter = p.radius * 2.0;
            m.circumference = 2.0 * kPi * p.radius;
            m.area = kPi * p.radius * p.radius;
        } else if constexpr (std::is_same_v<T, RectangleParams>) {
            m.midpoint = p.center;
            m.area = p.width * p.height;
            m.perimeter = 2.0 * (p.width + p.height);
        } else if constexpr (std::is_same_v<T, DiamondParams>) {
            m.midpoint = p.center;
            m.area = p.width * p.height * 0.5;
            // Four equal sides from center to adjacent cardinal points.
            m.perimeter = 4.0 * std::hypot(p.width * 0.5, p.height * 0.5);
        }
    }, params);
    return m;
}

} // namespace pixeloid
