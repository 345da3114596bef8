#include "pixeloid/viewport/viewport_window.h"
#include "pixeloid/coords/navigation_state.h"
#include "pixeloid/store/object_store.h"

namespace pixeloid {

AABB viewportWindow(double cellSizePx, const WorldPoint& panOffset, double surfaceWidthPx, double surfaceHeightPx) {
    return AABB{
        panOffset.x,
        panOffset.y,
        panOffset.x + surfaceWidthPx / cellSizePx,
        panOffset.y + surfaceHeightPx / cellSizePx,
    };
}

AABB viewportWindow(const NavigationState& nav, double surfaceWidthPx, double surfaceHeightPx) {
    return viewportWindow(nav.cellSizePx(), nav.panOffset(), surfaceWidthPx, surfaceHeightPx);
}

std::vector<const GeometricObject*> cullVisible(const ObjectStore& store, const AABB& window) {
    std::vector<const GeometricObject*> out;
    for (const GeometricObject& obj : store.all()) {
        if (!obj.visible) continue;
        if (aabbOverlaps(obj.bounds, window)) out.push_back(&obj);
    }
    return out;
}

} // namespace pixeloid
