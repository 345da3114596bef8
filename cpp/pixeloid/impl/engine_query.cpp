// PixeloidEngine read-only outputs for renderers and hit-testers

#include "pixeloid/engine.h"
#include "pixeloid/internal/engine_state.h"
#include "pixeloid/coords/coordinate_transform.h"
#include "pixeloid/viewport/viewport_window.h"
#include <utility>

std::vector<const GeometricObject*> PixeloidEngine::visibleShapes() const {
    return pixeloid::cullVisible(state().store, viewportWindow());
}

PickResult PixeloidEngine::pickWorld(const WorldPoint& world) const {
    const EngineState& st = state();
    const double tol = pixeloid::screenLengthToWorld(st.config.pickTolerancePx, st.navigation.cellSizePx());
    // Probe box around the point; independent of the surface size.
    const AABB probe{world.x - tol, world.y - tol, world.x + tol, world.y + tol};
    return st.pickSystem.pick(world, tol, pixeloid::cullVisible(st.store, probe));
}

std::optional<std::string> PixeloidEngine::hitTestWorld(const WorldPoint& world) const {
    PickResult res = pickWorld(world);
    if (!res.hitSomething()) return std::nullopt;
    return std::move(res.id);
}

PickResult PixeloidEngine::pickEx(const ScreenPoint& s) const {
    return pickWorld(toWorld(s));
}

std::optional<std::string> PixeloidEngine::hitTest(const ScreenPoint& s) const {
    return hitTestWorld(toWorld(s));
}

std::optional<GeometricObject> PixeloidEngine::currentPreview() const {
    return state().interactionSession.currentPreview();
}
