#include "pixeloid/geometry/vertex_edit.h"
#include "pixeloid/geometry/shape_generators.h"
#include "pixeloid/core/logging.h"
#include "pixeloid/core/util.h"
#include <cmath>
#include <cstring>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace pixeloid {

namespace {
    namespace ic = interaction_constants;

    bool sameBits(const WorldPoint& a, const WorldPoint& b) {
        return std::memcmp(&a.x, &b.x, sizeof(double)) == 0
            && std::memcmp(&a.y, &b.y, sizeof(double)) == 0;
    }

    ObjectError editRectangle(const RectangleParams& r, std::size_t index, const WorldPoint& p, RectangleParams& out) {
        const std::vector<WorldPoint> corners = generateVertices(r);
        const WorldPoint anchor = corners[(index + 2) % 4];
        const double width = std::abs(p.x - anchor.x);
        const double height = std::abs(p.y - anchor.y);
        if (!(width > 0.0) || !(height > 0.0)) return ObjectError::DegenerateEdit;
        out.center = { (anchor.x + p.x) * 0.5, (anchor.y + p.y) * 0.5 };
        out.width = width;
        out.height = height;
        return ObjectError::Ok;
    }

    ObjectError editDiamond(const DiamondParams& d, std::size_t index, const WorldPoint& p, DiamondParams& out) {
        out = d;
        const int i = static_cast<int>(index);
        if (i == ic::DiamondIndex::WEST || i == ic::DiamondIndex::EAST) {
            // Opposite horizontal extreme stays put.
            const double anchorX = (i == ic::DiamondIndex::WEST)
                ? d.center.x + d.width * 0.5
                : d.center.x - d.width * 0.5;
            const double width = std::abs(anchorX - p.x);
            if (!(width > 0.0)) return ObjectError::DegenerateEdit;
            out.center.x = (anchorX + p.x) * 0.5;
            out.width = width;
        } else {
            const double anchorY = (i == ic::DiamondIndex::NORTH)
                ? d.center.y + d.height * 0.5
                : d.center.y - d.height * 0.5;
            const double height = std::abs(anchorY - p.y);
            if (!(height > 0.0)) return ObjectError::DegenerateEdit;
            out.center.y = (anchorY + p.y) * 0.5;
            out.height = height;
        }
        return ObjectError::Ok;
    }
}

ObjectError deriveFromVertexEdit(
    const ShapeParameters& oldParams,
    std::size_t vertexIndex,
    const WorldPoint& newPoint,
    ShapeParameters& out,
    std::uint32_t circleSegments) {
    const std::size_t count = vertexCount(oldParams, circleSegments);
    if (vertexIndex >= count) {
        throw std::out_of_range(
            std::string("deriveFromVertexEdit: vertex index ") + std::to_string(vertexIndex)
            + " out of range for " + shapeKindName(kindOf(oldParams)));
    }
    if (!isFinite(newPoint.x) || !isFinite(newPoint.y)) {
        return ObjectError::InvalidParameters;
    }

    // Editing a vertex onto itself is a no-op on parameters.
    const std::vector<WorldPoint> current = generateVertices(oldParams, circleSegments);
    if (sameBits(current[vertexIndex], newPoint)) {
        out = oldParams;
        return ObjectError::Ok;
    }

    ShapeParameters next = oldParams;
    const ObjectError err = std::visit([&](auto& p) -> ObjectError {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, PointParams>) {
            p.center = newPoint;
            return ObjectError::Ok;
        } else if constexpr (std::is_same_v<T, LineParams>) {
            if (vertexIndex == 0) p.start = newPoint;
            else p.end = newPoint;
            return ObjectError::Ok;
        } else if constexpr (std::is_same_v<T, CircleParams>) {
            const double radius = std::hypot(newPoint.x - p.center.x, newPoint.y - p.center.y);
            if (!(radius > 0.0) || !isFinite(radius)) return ObjectError::DegenerateEdit;
            p.radius = radius;
            return ObjectError::Ok;
        } else if constexpr (std::is_same_v<T, RectangleParams>) {
            const RectangleParams old = p;
            return editRectangle(old, vertexIndex, newPoint, p);
        } else {
            const DiamondParams old = p;
            return editDiamond(old, vertexIndex, newPoint, p);
        }
    }, next);

    if (err != ObjectError::Ok) {
        PIXELOID_LOG_DEBUG("vertex edit rejected: kind=%s index=%zu err=%s",
                           shapeKindName(kindOf(oldParams)), vertexIndex, objectErrorName(err));
        return err;
    }
    // Guard against overflow to infinity on huge coordinates.
    if (validateParameters(next) != ObjectError::Ok) {
        return ObjectError::InvalidParameters;
    }
    out = next;
    return ObjectError::Ok;
}

} // namespace pixeloid
