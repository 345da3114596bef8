#include "pixeloid/coords/coordinate_transform.h"
#include <cmath>

namespace pixeloid {

WorldPoint screenToWorld(const ScreenPoint& s, double cellSizePx, const WorldPoint& panOffset) {
    return { s.x / cellSizePx + panOffset.x, s.y / cellSizePx + panOffset.y };
}

ScreenPoint worldToScreen(const WorldPoint& w, double cellSizePx, const WorldPoint& panOffset) {
    return { (w.x - panOffset.x) * cellSizePx, (w.y - panOffset.y) * cellSizePx };
}

CellPoint worldToCell(const WorldPoint& w) {
    return {
        static_cast<std::int64_t>(std::floor(w.x)),
        static_cast<std::int64_t>(std::floor(w.y)),
    };
}

CellPoint screenToCell(const ScreenPoint& s, double cellSizePx, const WorldPoint& panOffset) {
    return worldToCell(screenToWorld(s, cellSizePx, panOffset));
}

WorldPoint cellToWorld(const CellPoint& c) {
    return { static_cast<double>(c.x), static_cast<double>(c.y) };
}

WorldPoint cellCenter(const CellPoint& c) {
    return { static_cast<double>(c.x) + 0.5, static_cast<double>(c.y) + 0.5 };
}

} // namespace pixeloid
