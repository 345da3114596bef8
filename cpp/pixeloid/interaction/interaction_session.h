#pragma once

#include "pixeloid/interaction/interaction_types.h"
#include "pixeloid/coords/navigation_state.h"
#include "pixeloid/geometry/shape_params.h"
#include "pixeloid/store/object_store.h"
#include "pixeloid/core/types.h"
#include <cstdint>
#include <optional>
#include <string>

// Forward declarations
class PixeloidEngine; // Owner; all store writes go through it

// Sequences pointer and keyboard input into draw, select, drag and property
// edit operations. Holds no shapes itself: the only store writes are commits
// routed back through the engine.
class InteractionSession {
public:
    explicit InteractionSession(PixeloidEngine& engine);

    // ==============================================================================
    // State Query
    // ==============================================================================
    InteractionState state() const noexcept { return session_.state; }
    bool isDraftActive() const noexcept { return draft_.active; }

    // Id of the selected (or dragged / edited) shape; empty when none.
    const std::string& selectedId() const noexcept { return session_.id; }

    // Vertex being dragged in DraggingVertex, else -1.
    std::int32_t activeVertex() const noexcept { return session_.vertexIndex; }

    // ==============================================================================
    // UI-owned configuration (read, never owned here)
    // ==============================================================================
    void setDrawMode(std::optional<ShapeKind> kind) { drawMode_ = kind; }
    std::optional<ShapeKind> drawMode() const noexcept { return drawMode_; }

    void setDrawStyle(const StrokeStyle& style) { drawStyle_ = style; }
    const StrokeStyle& drawStyle() const noexcept { return drawStyle_; }

    // ==============================================================================
    // Input
    // ==============================================================================
    void handlePointer(const PointerEvent& ev);
    void handleKey(InteractionKey key, KeyPhase phase);

    // Per-frame update for held pan keys. Returns true when the view moved.
    bool tick(double dtSeconds);

    // ==============================================================================
    // Selection / property editing
    // ==============================================================================
    bool select(const std::string& id);
    void clearSelection();

    bool openPropertyEditor();
    ObjectError commitPropertyEdit(const ShapeParameters& params);
    void cancelPropertyEdit();

    // Abandons whatever is in flight (Escape semantics).
    void cancel();

    // Engine notifications
    void onObjectRemoved(const std::string& id);
    void onCircleSegmentsChanged();
    void reset();

    KeyboardPanController& keyboardPan() noexcept { return keyboardPan_; }
    const KeyboardPanController& keyboardPan() const noexcept { return keyboardPan_; }

    // ==============================================================================
    // Draft API (ephemeral preview, never written to the store)
    // ==============================================================================
    std::optional<GeometricObject> currentPreview() const;

private:
    PixeloidEngine& engine_;

    struct SessionState {
        InteractionState state = InteractionState::Idle;
        std::string id;
        std::int32_t vertexIndex = -1;
        WorldPoint lastPoint{0.0, 0.0};
        bool pressed = false;
        bool dragArmed = false;          // press landed on the already-selected shape
        ShapeParameters pressParams{};   // restored on Escape during a drag
    };

    struct DraftState {
        bool active = false;
        ShapeKind kind = ShapeKind::Point;
        WorldPoint anchor{0.0, 0.0};
        WorldPoint current{0.0, 0.0};
        bool moved = false;
    };

    SessionState session_;
    DraftState draft_;
    std::optional<ShapeKind> drawMode_;
    StrokeStyle drawStyle_;
    KeyboardPanController keyboardPan_;

    void onPointerDown(const WorldPoint& world);
    void onPointerMove(const WorldPoint& world);
    void onPointerUp(const WorldPoint& world);

    void setSelected(const std::string& id);
    void beginDrag(const WorldPoint& world);
    void beginVertexDrag(std::int32_t vertexIndex, const WorldPoint& world);
    void cancelTransform();
    void recenter();

    void beginDraft(ShapeKind kind, const WorldPoint& world);
    void updateDraft(const WorldPoint& world);
    bool commitDraft(const WorldPoint& world);
    void cancelDraft();
    ShapeParameters draftParameters() const;
};
