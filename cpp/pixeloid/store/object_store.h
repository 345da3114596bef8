#pragma once

#include "pixeloid/core/types.h"
#include "pixeloid/geometry/shape_params.h"
#include "pixeloid/interaction/interaction_constants.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

// One stored shape. `parameters` is authoritative; `vertices` and `bounds` are
// regenerated from it on every geometry write and never edited in place.
struct GeometricObject {
    std::string id;
    ShapeKind kind;
    std::vector<WorldPoint> vertices;
    ShapeParameters parameters;
    StrokeStyle style;
    AABB bounds;
    bool visible;
    double createdAt; // ms, from nowMs()
};

struct ObjectStoreStats {
    std::uint32_t total;
    std::uint32_t visible;
    std::uint32_t totalVertices;
    std::array<std::uint32_t, 5> perKind; // indexed by ShapeKind - 1
};

class ObjectStore {
public:
    explicit ObjectStore(std::uint32_t circleSegments = interaction_constants::DEFAULT_CIRCLE_SEGMENTS);

    // ==============================================================================
    // Mutations. All are atomic: a rejected call leaves the store untouched.
    // ==============================================================================

    // `kind` must match the parameters alternative.
    CreateResult create(ShapeKind kind, const ShapeParameters& params, const StrokeStyle& style);

    // Kind of the stored shape cannot change.
    ObjectError updateByParameters(const std::string& id, const ShapeParameters& params);

    // Runs deriveFromVertexEdit then regenerates. Throws std::out_of_range for
    // an index outside the shape's vertex list.
    ObjectError updateByVertexEdit(const std::string& id, std::size_t vertexIndex, const WorldPoint& newPoint);

    ObjectError translate(const std::string& id, const WorldPoint& delta);
    ObjectError updateStyle(const std::string& id, const StrokeStyle& style);
    ObjectError setVisible(const std::string& id, bool visible);
    ObjectError remove(const std::string& id);

    // Id counter keeps running; ids are never reused within one store.
    void clear() noexcept;

    // Regenerates every circle when the sample count changes.
    void setCircleSegments(std::uint32_t segments);
    std::uint32_t circleSegments() const noexcept { return circleSegments_; }

    // ==============================================================================
    // Read-only queries
    // ==============================================================================
    const GeometricObject* get(const std::string& id) const;
    bool contains(const std::string& id) const { return index_.find(id) != index_.end(); }
    const std::vector<GeometricObject>& all() const noexcept { return objects_; }
    std::size_t size() const noexcept { return objects_.size(); }

    // Ids of every shape (visible or not) whose bounds overlap rect.
    std::vector<std::string> queryByBounds(const AABB& rect) const;

    ObjectStoreStats stats() const;

    // Numeric part of an "obj_<n>" id, 0 for anything else.
    static std::uint32_t serialOf(const std::string& id);

    // Monotonic counter bumped on every successful mutation.
    std::uint32_t generation() const noexcept { return generation_; }

private:
    std::vector<GeometricObject> objects_;
    std::unordered_map<std::string, std::size_t> index_;
    std::uint64_t nextId_{1};
    std::uint32_t circleSegments_;
    std::uint32_t generation_{0};

    GeometricObject* find(const std::string& id);
    void regenerate(GeometricObject& obj) const;
    void rebuildIndex();
};
