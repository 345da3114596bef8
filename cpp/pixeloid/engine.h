#pragma once

#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "pixeloid/core/util.h"
#include "pixeloid/core/types.h"
#include "pixeloid/core/config.h"
#include "pixeloid/coords/navigation_state.h"
#include "pixeloid/geometry/shape_params.h"
#include "pixeloid/interaction/interaction_types.h"
#include "pixeloid/interaction/pick_system.h"
#include "pixeloid/protocol/protocol_types.h"
#include "pixeloid/store/object_store.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct EngineState;

// Owns navigation, the object store, the interaction session, the output
// surface size and the change-event stream. Collaborators read through the
// const query surface; every write below records events and lastError.
class PixeloidEngine {
    friend class InteractionSession;
    friend class PixeloidEngineTestAccessor;
public:
    using EventType = pixeloid::protocol::EventType;
    using ChangeMask = pixeloid::protocol::ChangeMask;
    using ViewChangeMask = pixeloid::protocol::ViewChangeMask;
    using EngineEvent = pixeloid::protocol::EngineEvent;
    using EventBufferMeta = pixeloid::protocol::EventBufferMeta;

    PixeloidEngine();
    explicit PixeloidEngine(const EngineConfig& config);
    ~PixeloidEngine();

    PixeloidEngine(const PixeloidEngine&) = delete;
    PixeloidEngine& operator=(const PixeloidEngine&) = delete;

    // Drops every shape, cancels interaction and resets the event stream.
    // Navigation and configuration are kept.
    void clear() noexcept;

    // ==============================================================================
    // Configuration
    // ==============================================================================
    // Invalid configs are refused and the previous one stays active.
    bool setConfig(const EngineConfig& config);
    const EngineConfig& config() const noexcept;

    // ==============================================================================
    // Navigation and coordinates
    // ==============================================================================
    bool setCellSize(double px);
    bool pan(const WorldPoint& deltaWorld);
    void snapToCell();
    bool setSurfaceSize(double widthPx, double heightPx);
    bool centerOn(const WorldPoint& worldPoint);
    void resetView();

    const NavigationState& navigation() const noexcept;
    double surfaceWidth() const noexcept;
    double surfaceHeight() const noexcept;
    AABB viewportWindow() const;

    WorldPoint toWorld(const ScreenPoint& s) const;
    ScreenPoint toScreen(const WorldPoint& w) const;
    CellPoint toCell(const ScreenPoint& s) const;

    // ==============================================================================
    // Object store (single mutation path)
    // ==============================================================================
    CreateResult create(ShapeKind kind, const ShapeParameters& params, const StrokeStyle& style);
    ObjectError updateByParameters(const std::string& id, const ShapeParameters& params);
    ObjectError updateByVertexEdit(const std::string& id, std::size_t vertexIndex, const WorldPoint& newPoint);
    ObjectError translate(const std::string& id, const WorldPoint& delta);
    ObjectError updateStyle(const std::string& id, const StrokeStyle& style);
    ObjectError setVisible(const std::string& id, bool visible);
    ObjectError remove(const std::string& id);

    const GeometricObject* get(const std::string& id) const;
    const std::vector<GeometricObject>& all() const noexcept;
    std::vector<std::string> queryByBounds(const AABB& rect) const;
    ObjectStoreStats stats() const;
    const ObjectStore& store() const noexcept;

    ObjectError lastError() const noexcept;

    // ==============================================================================
    // Outputs for collaborators
    // ==============================================================================
    std::vector<const GeometricObject*> visibleShapes() const;

    // Topmost visible shape under the screen point, tolerance in screen pixels
    // from the config.
    std::optional<std::string> hitTest(const ScreenPoint& s) const;
    PickResult pickEx(const ScreenPoint& s) const;

    std::optional<GeometricObject> currentPreview() const;

    // ==============================================================================
    // Input (interaction state machine)
    // ==============================================================================
    void setDrawMode(std::optional<ShapeKind> kind);
    std::optional<ShapeKind> drawMode() const;
    void setDrawStyle(const StrokeStyle& style);

    void handlePointer(const PointerEvent& ev);
    void handleKey(InteractionKey key, KeyPhase phase);
    // Advances held-key panning by one frame.
    void tick(double dtSeconds);

    bool selectShape(const std::string& id);
    void clearSelection();
    bool openPropertyEditor();
    ObjectError commitPropertyEdit(const ShapeParameters& params);
    void cancelPropertyEdit();

    InteractionState interactionState() const noexcept;
    const std::string& selectedId() const noexcept;

    // ==============================================================================
    // Event stream
    // ==============================================================================
    EventBufferMeta pollEvents(std::uint32_t maxEvents);
    void ackResync(std::uint32_t resyncGeneration);
    std::uint32_t generation() const noexcept;

    // FNV-1a over document and view state. createdAt is excluded.
    std::uint64_t documentDigest() const;

private:
    std::unique_ptr<EngineState> state_;

    EngineState& state() noexcept { return *state_; }
    const EngineState& state() const noexcept { return *state_; }

    ObjectError setError(ObjectError err) const;
    std::optional<std::string> hitTestWorld(const WorldPoint& world) const;
    PickResult pickWorld(const WorldPoint& world) const;

    void clearEventState();
    void recordDocChanged(std::uint32_t mask);
    void recordEntityChanged(std::uint32_t serial, std::uint32_t mask);
    void recordEntityCreated(std::uint32_t serial, std::uint32_t kind);
    void recordEntityDeleted(std::uint32_t serial);
    void recordSelectionChanged();
    void recordViewChanged(std::uint32_t mask);
    bool pushEvent(const EngineEvent& ev);
    void flushPendingEvents();
    void clearPending();
};
