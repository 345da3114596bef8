// PixeloidEngine object store wrappers
// Every write goes through here so events and lastError stay in step with the store.

#include "pixeloid/engine.h"
#include "pixeloid/internal/engine_state.h"
#include "pixeloid/core/logging.h"

namespace {
constexpr std::uint32_t kGeometryMask =
    static_cast<std::uint32_t>(pixeloid::protocol::ChangeMask::Geometry)
    | static_cast<std::uint32_t>(pixeloid::protocol::ChangeMask::Bounds);
}

ObjectError PixeloidEngine::setError(ObjectError err) const {
    state_->lastError = err;
    return err;
}

ObjectError PixeloidEngine::lastError() const noexcept {
    return state().lastError;
}

CreateResult PixeloidEngine::create(ShapeKind kind, const ShapeParameters& params, const StrokeStyle& style) {
    CreateResult res = state().store.create(kind, params, style);
    setError(res.error);
    if (!res.ok()) return res;

    state().generation++;
    recordEntityCreated(ObjectStore::serialOf(res.id), static_cast<std::uint32_t>(kind));
    PIXELOID_LOG_DEBUG("created %s %s", shapeKindName(kind), res.id.c_str());
    return res;
}

ObjectError PixeloidEngine::updateByParameters(const std::string& id, const ShapeParameters& params) {
    const ObjectError err = setError(state().store.updateByParameters(id, params));
    if (err != ObjectError::Ok) return err;
    state().generation++;
    recordEntityChanged(ObjectStore::serialOf(id), kGeometryMask);
    return err;
}

ObjectError PixeloidEngine::updateByVertexEdit(const std::string& id, std::size_t vertexIndex, const WorldPoint& newPoint) {
    const ObjectError err = setError(state().store.updateByVertexEdit(id, vertexIndex, newPoint));
    if (err != ObjectError::Ok) return err;
    state().generation++;
    recordEntityChanged(ObjectStore::serialOf(id), kGeometryMask);
    return err;
}

ObjectError PixeloidEngine::translate(const std::string& id, const WorldPoint& delta) {
    const ObjectError err = setError(state().store.translate(id, delta));
    if (err != ObjectError::Ok) return err;
    state().generation++;
    recordEntityChanged(ObjectStore::serialOf(id), kGeometryMask);
    return err;
}

ObjectError PixeloidEngine::updateStyle(const std::string& id, const StrokeStyle& style) {
    const ObjectError err = setError(state().store.updateStyle(id, style));
    if (err != ObjectError::Ok) return err;
    state().generation++;
    recordEntityChanged(ObjectStore::serialOf(id), static_cast<std::uint32_t>(ChangeMask::Style));
    return err;
}

ObjectError PixeloidEngine::setVisible(const std::string& id, bool visible) {
    const GeometricObject* obj = state().store.get(id);
    const bool changed = obj && obj->visible != visible;
    const ObjectError err = setError(state().store.setVisible(id, visible));
    if (err != ObjectError::Ok || !changed) return err;
    state().generation++;
    recordEntityChanged(ObjectStore::serialOf(id), static_cast<std::uint32_t>(ChangeMask::Visibility));
    return err;
}

ObjectError PixeloidEngine::remove(const std::string& id) {
    const ObjectError err = setError(state().store.remove(id));
    if (err != ObjectError::Ok) return err;
    state().generation++;
    recordEntityDeleted(ObjectStore::serialOf(id));
    state().interactionSession.onObjectRemoved(id);
    return err;
}

const GeometricObject* PixeloidEngine::get(const std::string& id) const {
    return state().store.get(id);
}

const std::vector<GeometricObject>& PixeloidEngine::all() const noexcept {
    return state().store.all();
}

std::vector<std::string> PixeloidEngine::queryByBounds(const AABB& rect) const {
    return state().store.queryByBounds(rect);
}

ObjectStoreStats PixeloidEngine::stats() const {
    return state().store.stats();
}

const ObjectStore& PixeloidEngine::store() const noexcept {
    return state().store;
}
