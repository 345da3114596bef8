#include "pixeloid/interaction/pick_system.h"
#include "pixeloid/store/object_store.h"
#include "pixeloid/viewport/viewport_window.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>

// Math helpers
static double distSq(double x1, double y1, double x2, double y2) {
    const double dx = x1 - x2;
    const double dy = y1 - y2;
    return dx * dx + dy * dy;
}

static double distToSegmentSq(double px, double py, double x1, double y1, double x2, double y2) {
    const double l2 = distSq(x1, y1, x2, y2);
    if (l2 == 0) return distSq(px, py, x1, y1);
    double t = ((px - x1) * (x2 - x1) + (py - y1) * (y2 - y1)) / l2;
    t = std::max(0.0, std::min(1.0, t));
    return distSq(px, py, x1 + t * (x2 - x1), y1 + t * (y2 - y1));
}

static AABB expanded(const AABB& b, double tol) {
    return AABB{b.minX - tol, b.minY - tol, b.maxX + tol, b.maxY + tol};
}

bool PickSystem::checkCandidate(const GeometricObject& object, const WorldPoint& p, double tolerance,
                                std::uint32_t zIndex, PickCandidate& outCandidate) const {
    const double tol = std::max(0.0, tolerance);
    const AABB probe{p.x, p.y, p.x, p.y};
    if (!pixeloid::aabbOverlaps(expanded(object.bounds, tol), probe)) return false;

    outCandidate.object = &object;
    outCandidate.subIndex = -1;
    outCandidate.zIndex = zIndex;

    const bool hit = std::visit([&](const auto& s) -> bool {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, PointParams>) {
            const double d = std::sqrt(distSq(p.x, p.y, s.center.x, s.center.y));
            if (d > tol) return false;
            outCandidate.subTarget = PickSubTarget::Body;
            outCandidate.distance = d;
            return true;
        } else if constexpr (std::is_same_v<T, LineParams>) {
            const double d = std::sqrt(distToSegmentSq(p.x, p.y, s.start.x, s.start.y, s.end.x, s.end.y));
            if (d > tol) return false;
            outCandidate.subTarget = PickSubTarget::Edge;
            outCandidate.distance = d;
            return true;
        } else if constexpr (std::is_same_v<T, CircleParams>) {
            const double d = std::sqrt(distSq(p.x, p.y, s.center.x, s.center.y));
            if (d > s.radius + tol) return false;
            const double edgeDist = std::abs(d - s.radius);
            outCandidate.subTarget = edgeDist <= tol ? PickSubTarget::Edge : PickSubTarget::Body;
            outCandidate.distance = edgeDist <= tol ? edgeDist : 0.0;
            return true;
        } else if constexpr (std::is_same_v<T, RectangleParams>) {
            const double dx = std::abs(p.x - s.center.x);
            const double dy = std::abs(p.y - s.center.y);
            const double hw = s.width * 0.5;
            const double hh = s.height * 0.5;
            if (dx > hw + tol || dy > hh + tol) return false;
            const double edgeDist = std::min(std::abs(dx - hw), std::abs(dy - hh));
            outCandidate.subTarget = edgeDist <= tol ? PickSubTarget::Edge : PickSubTarget::Body;
            outCandidate.distance = edgeDist <= tol ? edgeDist : 0.0;
            return true;
        } else {
            // |dx| / a + |dy| / b <= 1 with the half-axes grown by the tolerance.
            const double a = s.width * 0.5 + tol;
            const double b = s.height * 0.5 + tol;
            const double dx = std::abs(p.x - s.center.x);
            const double dy = std::abs(p.y - s.center.y);
            const double metric = dx / a + dy / b;
            if (metric > 1.0) return false;
            outCandidate.subTarget = PickSubTarget::Body;
            outCandidate.distance = 0.0;
            return true;
        }
    }, object.parameters);
    if (!hit) return false;

    // A generated vertex within tolerance outranks the edge or body under it.
    const std::int32_t vertex = pickVertex(object, p, tol);
    if (vertex >= 0) {
        const WorldPoint& v = object.vertices[static_cast<std::size_t>(vertex)];
        outCandidate.subTarget = PickSubTarget::Vertex;
        outCandidate.subIndex = vertex;
        outCandidate.distance = std::sqrt(distSq(p.x, p.y, v.x, v.y));
    }
    return true;
}

PickResult PickSystem::pick(const WorldPoint& p, double tolerance,
                            const std::vector<const GeometricObject*>& candidates) const {
    PickResult res{std::string(), ShapeKind::Point, PickSubTarget::None, -1,
                   std::numeric_limits<double>::infinity(), p};
    lastStats_ = PickStats{0, 0};

    PickCandidate best{};
    bool found = false;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        const GeometricObject* obj = candidates[i];
        if (!obj) continue;
        lastStats_.candidatesChecked++;
        PickCandidate c{};
        if (!checkCandidate(*obj, p, tolerance, static_cast<std::uint32_t>(i), c)) continue;
        lastStats_.hits++;
        if (!found || c < best) {
            best = c;
            found = true;
        }
    }

    if (!found) return res;

    res.id = best.object->id;
    res.kind = best.object->kind;
    res.subTarget = best.subTarget;
    res.subIndex = best.subIndex;
    res.distance = best.distance;
    return res;
}

std::int32_t PickSystem::pickVertex(const GeometricObject& object, const WorldPoint& p, double radius) const {
    const double r2 = radius * radius;
    std::int32_t bestIndex = -1;
    double bestD2 = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < object.vertices.size(); ++i) {
        const double d2 = distSq(p.x, p.y, object.vertices[i].x, object.vertices[i].y);
        if (d2 <= r2 && d2 < bestD2) {
            bestD2 = d2;
            bestIndex = static_cast<std::int32_t>(i);
        }
    }
    return bestIndex;
}
