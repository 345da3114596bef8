#include "pixeloid/store/object_store.h"
#include "pixeloid/core/config.h"
#include "pixeloid/core/logging.h"
#include "pixeloid/core/util.h"
#include "pixeloid/geometry/shape_generators.h"
#include "pixeloid/geometry/vertex_edit.h"
#include "pixeloid/viewport/viewport_window.h"
#include <utility>

ObjectStore::ObjectStore(std::uint32_t circleSegments)
    : circleSegments_(circleSegments >= 3 ? circleSegments : interaction_constants::DEFAULT_CIRCLE_SEGMENTS) {}

GeometricObject* ObjectStore::find(const std::string& id) {
    auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &objects_[it->second];
}

const GeometricObject* ObjectStore::get(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &objects_[it->second];
}

void ObjectStore::regenerate(GeometricObject& obj) const {
    obj.vertices = pixeloid::generateVertices(obj.parameters, circleSegments_);
    obj.bounds = pixeloid::computeBounds(obj.vertices);
}

void ObjectStore::rebuildIndex() {
    index_.clear();
    for (std::size_t i = 0; i < objects_.size(); ++i) {
        index_[objects_[i].id] = i;
    }
}

CreateResult ObjectStore::create(ShapeKind kind, const ShapeParameters& params, const StrokeStyle& style) {
    if (pixeloid::kindOf(params) != kind) {
        PIXELOID_LOG_DEBUG("create rejected: kind %s does not match parameters %s",
                           shapeKindName(kind), shapeKindName(pixeloid::kindOf(params)));
        return CreateResult{ObjectError::InvalidParameters, {}};
    }
    if (pixeloid::validateParameters(params) != ObjectError::Ok || !pixeloid::isValidStyle(style)) {
        PIXELOID_LOG_DEBUG("create rejected: invalid %s", shapeKindName(kind));
        return CreateResult{ObjectError::InvalidParameters, {}};
    }

    GeometricObject obj{};
    obj.id = "obj_" + std::to_string(nextId_);
    obj.kind = kind;
    obj.parameters = params;
    obj.style = style;
    obj.visible = true;
    obj.createdAt = pixeloid::nowMs();
    regenerate(obj);

    nextId_++;
    const std::string id = obj.id;
    index_[id] = objects_.size();
    objects_.push_back(std::move(obj));
    generation_++;
    return CreateResult{ObjectError::Ok, id};
}

ObjectError ObjectStore::updateByParameters(const std::string& id, const ShapeParameters& params) {
    GeometricObject* obj = find(id);
    if (!obj) return ObjectError::UnknownObjectId;
    if (pixeloid::kindOf(params) != obj->kind) return ObjectError::InvalidParameters;
    if (pixeloid::validateParameters(params) != ObjectError::Ok) return ObjectError::InvalidParameters;

    obj->parameters = params;
    regenerate(*obj);
    generation_++;
    return ObjectError::Ok;
}

ObjectError ObjectStore::updateByVertexEdit(const std::string& id, std::size_t vertexIndex, const WorldPoint& newPoint) {
    GeometricObject* obj = find(id);
    if (!obj) return ObjectError::UnknownObjectId;

    ShapeParameters next = obj->parameters;
    const ObjectError err = pixeloid::deriveFromVertexEdit(obj->parameters, vertexIndex, newPoint, next, circleSegments_);
    if (err != ObjectError::Ok) return err;

    obj->parameters = next;
    regenerate(*obj);
    generation_++;
    return ObjectError::Ok;
}

ObjectError ObjectStore::translate(const std::string& id, const WorldPoint& delta) {
    GeometricObject* obj = find(id);
    if (!obj) return ObjectError::UnknownObjectId;
    if (!pixeloid::isFinite(delta.x) || !pixeloid::isFinite(delta.y)) return ObjectError::InvalidParameters;

    const ShapeParameters moved = pixeloid::translateParameters(obj->parameters, delta);
    if (pixeloid::validateParameters(moved) != ObjectError::Ok) return ObjectError::InvalidParameters;

    obj->parameters = moved;
    regenerate(*obj);
    generation_++;
    return ObjectError::Ok;
}

ObjectError ObjectStore::updateStyle(const std::string& id, const StrokeStyle& style) {
    GeometricObject* obj = find(id);
    if (!obj) return ObjectError::UnknownObjectId;
    if (!pixeloid::isValidStyle(style)) return ObjectError::InvalidParameters;
    obj->style = style;
    generation_++;
    return ObjectError::Ok;
}

ObjectError ObjectStore::setVisible(const std::string& id, bool visible) {
    GeometricObject* obj = find(id);
    if (!obj) return ObjectError::UnknownObjectId;
    if (obj->visible != visible) {
        obj->visible = visible;
        generation_++;
    }
    return ObjectError::Ok;
}

ObjectError ObjectStore::remove(const std::string& id) {
    auto it = index_.find(id);
    if (it == index_.end()) return ObjectError::UnknownObjectId;
    objects_.erase(objects_.begin() + static_cast<std::ptrdiff_t>(it->second));
    rebuildIndex();
    generation_++;
    return ObjectError::Ok;
}

void ObjectStore::clear() noexcept {
    objects_.clear();
    index_.clear();
    generation_++;
}

void ObjectStore::setCircleSegments(std::uint32_t segments) {
    if (segments < 3 || segments == circleSegments_) return;
    circleSegments_ = segments;
    for (GeometricObject& obj : objects_) {
        if (obj.kind == ShapeKind::Circle) regenerate(obj);
    }
    generation_++;
}

std::vector<std::string> ObjectStore::queryByBounds(const AABB& rect) const {
    std::vector<std::string> out;
    for (const GeometricObject& obj : objects_) {
        if (pixeloid::aabbOverlaps(obj.bounds, rect)) out.push_back(obj.id);
    }
    return out;
}

std::uint32_t ObjectStore::serialOf(const std::string& id) {
    static constexpr char kPrefix[] = "obj_";
    constexpr std::size_t kPrefixLen = sizeof(kPrefix) - 1;
    if (id.size() <= kPrefixLen || id.compare(0, kPrefixLen, kPrefix) != 0) return 0;
    std::uint64_t value = 0;
    for (std::size_t i = kPrefixLen; i < id.size(); ++i) {
        const char c = id[i];
        if (c < '0' || c > '9') return 0;
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
        if (value > 0xffffffffull) return 0;
    }
    return static_cast<std::uint32_t>(value);
}

ObjectStoreStats ObjectStore::stats() const {
    ObjectStoreStats s{};
    for (const GeometricObject& obj : objects_) {
        s.total++;
        if (obj.visible) s.visible++;
        s.totalVertices += static_cast<std::uint32_t>(obj.vertices.size());
        s.perKind[static_cast<std::size_t>(obj.kind) - 1]++;
    }
    return s;
}
