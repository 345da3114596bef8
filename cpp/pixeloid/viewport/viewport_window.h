#pragma once

#include "pixeloid/core/types.h"
#include <vector>

class NavigationState;
class ObjectStore;
struct GeometricObject;

namespace pixeloid {

// Visible world rectangle. Derived on demand from the navigation scalars and
// the surface size; never cached.
AABB viewportWindow(double cellSizePx, const WorldPoint& panOffset, double surfaceWidthPx, double surfaceHeightPx);
AABB viewportWindow(const NavigationState& nav, double surfaceWidthPx, double surfaceHeightPx);

// Standard AABB overlap. Touching edges count as overlapping.
inline bool aabbOverlaps(const AABB& bounds, const AABB& window) {
    return !(bounds.maxX < window.minX || bounds.minX > window.maxX
          || bounds.maxY < window.minY || bounds.minY > window.maxY);
}

// Visible shapes whose bounds overlap the window, in creation order. O(n).
std::vector<const GeometricObject*> cullVisible(const ObjectStore& store, const AABB& window);

} // namespace pixeloid
