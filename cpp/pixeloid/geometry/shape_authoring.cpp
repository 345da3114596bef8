#include "pixeloid/geometry/shape_authoring.h"
#include "pixeloid/coords/anchor.h"
#include <cmath>

namespace pixeloid {

ShapeParameters parametersFromDrag(ShapeKind kind, const WorldPoint& first, const WorldPoint& current) {
    const double dx = current.x - first.x;
    const double dy = current.y - first.y;

    switch (kind) {
        case ShapeKind::Point:
            return PointParams{current};
        case ShapeKind::Line:
            return LineParams{first, current};
        case ShapeKind::Circle: {
            const WorldPoint mid{(first.x + current.x) * 0.5, (first.y + current.y) * 0.5};
            return CircleParams{mid, std::hypot(dx, dy) * 0.5};
        }
        case ShapeKind::Rectangle: {
            const WorldPoint mid{(first.x + current.x) * 0.5, (first.y + current.y) * 0.5};
            return RectangleParams{mid, std::abs(dx), std::abs(dy)};
        }
        case ShapeKind::Diamond: {
            const double width = std::abs(dx);
            const double height = width * interaction_constants::DIAMOND_ISOMETRIC_RATIO;
            // West vertex stays under the press point; drag direction only sets the size.
            return DiamondParams{{first.x + width * 0.5, first.y}, width, height};
        }
    }
    return PointParams{current};
}

WorldPoint snapAuthoringPoint(const WorldPoint& p, ShapeKind kind, const DrawingSettings& settings) {
    if (!settings.snapToAnchor) return p;
    return snapToAnchor(p, settings.anchorFor(kind));
}

} // namespace pixeloid
