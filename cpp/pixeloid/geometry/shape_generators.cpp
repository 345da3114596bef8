#include "pixeloid/geometry/shape_generators.h"
#include "pixeloid/core/util.h"
#include <algorithm>
#include <cmath>
#include <type_traits>

namespace pixeloid {

namespace {
    constexpr double kTwoPi = 6.283185307179586476925286766559;

    bool finitePoint(const WorldPoint& p) {
        return isFinite(p.x) && isFinite(p.y);
    }

    bool positiveSize(double v) {
        return isFinite(v) && v > 0.0;
    }

    WorldPoint shifted(const WorldPoint& p, const WorldPoint& d) {
        return { p.x + d.x, p.y + d.y };
    }
}

std::vector<WorldPoint> generateVertices(const ShapeParameters& params, std::uint32_t circleSegments) {
    std::vector<WorldPoint> out;
    std::visit([&](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, PointParams>) {
            out.push_back(p.center);
        } else if constexpr (std::is_same_v<T, LineParams>) {
            out.reserve(2);
            out.push_back(p.start);
            out.push_back(p.end);
        } else if constexpr (std::is_same_v<T, CircleParams>) {
            const std::uint32_t n = circleSegments > 0 ? circleSegments : 1;
            out.reserve(n);
            for (std::uint32_t i = 0; i < n; ++i) {
                const double angle = kTwoPi * static_cast<double>(i) / static_cast<double>(n);
                out.push_back({ p.center.x + p.radius * std::cos(angle), p.center.y + p.radius * std::sin(angle) });
            }
        } else if constexpr (std::is_same_v<T, RectangleParams>) {
            const double hw = p.width * 0.5;
            const double hh = p.height * 0.5;
            out.reserve(4);
            out.push_back({ p.center.x - hw, p.center.y - hh });
            out.push_back({ p.center.x + hw, p.center.y - hh });
            out.push_back({ p.center.x + hw, p.center.y + hh });
            out.push_back({ p.center.x - hw, p.center.y + hh });
        } else if constexpr (std::is_same_v<T, DiamondParams>) {
            const double hw = p.width * 0.5;
            const double hh = p.height * 0.5;
            out.reserve(4);
            out.push_back({ p.center.x - hw, p.center.y });
            out.push_back({ p.center.x, p.center.y - hh });
            out.push_back({ p.center.x + hw, p.center.y });
            out.push_back({ p.center.x, p.center.y + hh });
        }
    }, params);
    return out;
}

std::size_t vertexCount(const ShapeParameters& params, std::uint32_t circleSegments) {
    switch (kindOf(params)) {
        case ShapeKind::Point: return 1;
        case ShapeKind::Line: return 2;
        case ShapeKind::Circle: return circleSegments > 0 ? circleSegments : 1;
        case ShapeKind::Rectangle: return 4;
        case ShapeKind::Diamond: return 4;
    }
    return 0;
}

AABB computeBounds(const std::vector<WorldPoint>& vertices) {
    if (vertices.empty()) return AABB{0.0, 0.0, 0.0, 0.0};
    AABB b{vertices[0].x, vertices[0].y, vertices[0].x, vertices[0].y};
    for (std::size_t i = 1; i < vertices.size(); ++i) {
        b.minX = std::min(b.minX, vertices[i].x);
        b.minY = std::min(b.minY, vertices[i].y);
        b.maxX = std::max(b.maxX, vertices[i].x);
        b.maxY = std::max(b.maxY, vertices[i].y);
    }
    return b;
}

ObjectError validateParameters(const ShapeParameters& params) {
    const bool ok = std::visit([](const auto& p) -> bool {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, PointParams>) {
            return finitePoint(p.center);
        } else if constexpr (std::is_same_v<T, LineParams>) {
            return finitePoint(p.start) && finitePoint(p.end);
        } else if constexpr (std::is_same_v<T, CircleParams>) {
            return finitePoint(p.center) && positiveSize(p.radius);
        } else {
            return finitePoint(p.center) && positiveSize(p.width) && positiveSize(p.height);
        }
    }, params);
    return ok ? ObjectError::Ok : ObjectError::InvalidParameters;
}

ShapeParameters translateParameters(const ShapeParameters& params, const WorldPoint& delta) {
    return std::visit([&](const auto& p) -> ShapeParameters {
        using T = std::decay_t<decltype(p)>;
        T moved = p;
        if constexpr (std::is_same_v<T, LineParams>) {
            moved.start = shifted(p.start, delta);
            moved.end = shifted(p.end, delta);
        } else {
            moved.center = shifted(p.center, delta);
        }
        return moved;
    }, params);
}

} // namespace pixeloid
