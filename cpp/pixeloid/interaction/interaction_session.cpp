#include "pixeloid/interaction/interaction_session.h"
#include "pixeloid/engine.h"
#include "pixeloid/internal/engine_state.h"
#include "pixeloid/coords/coordinate_transform.h"
#include "pixeloid/geometry/vertex_edit.h"
#include "pixeloid/core/logging.h"

InteractionSession::InteractionSession(PixeloidEngine& engine)
    : engine_(engine),
      drawStyle_(EngineConfig{}.defaultStyle) {}

// ==============================================================================
// Pointer routing
// ==============================================================================

void InteractionSession::handlePointer(const PointerEvent& ev) {
    if (ev.button != PointerButton::Primary) return;
    const WorldPoint world = engine_.toWorld(ev.screenPoint);
    switch (ev.phase) {
        case PointerPhase::Down: onPointerDown(world); break;
        case PointerPhase::Move: onPointerMove(world); break;
        case PointerPhase::Up: onPointerUp(world); break;
    }
}

void InteractionSession::onPointerDown(const WorldPoint& world) {
    switch (session_.state) {
        case InteractionState::Idle: {
            if (drawMode_) {
                beginDraft(*drawMode_, world);
                return;
            }
            const std::optional<std::string> hit = engine_.hitTestWorld(world);
            if (hit) {
                setSelected(*hit);
                // First press only selects; dragging needs the shape to be selected already.
                session_.pressed = true;
                session_.dragArmed = false;
                session_.lastPoint = world;
            }
            return;
        }

        case InteractionState::Selected: {
            const GeometricObject* selected = engine_.get(session_.id);
            if (selected) {
                const EngineState& st = engine_.state();
                const double radius = pixeloid::screenLengthToWorld(
                    st.config.vertexHandleRadiusPx, st.navigation.cellSizePx());
                const std::int32_t vertex = st.pickSystem.pickVertex(*selected, world, radius);
                if (vertex >= 0) {
                    beginVertexDrag(vertex, world);
                    return;
                }
            }

            const std::optional<std::string> hit = engine_.hitTestWorld(world);
            if (hit && *hit == session_.id) {
                session_.pressed = true;
                session_.dragArmed = true;
                session_.lastPoint = world;
                return;
            }
            if (hit) {
                setSelected(*hit);
                session_.pressed = true;
                session_.dragArmed = false;
                session_.lastPoint = world;
                return;
            }

            clearSelection();
            if (drawMode_) beginDraft(*drawMode_, world);
            return;
        }

        case InteractionState::Drawing:
        case InteractionState::Previewing:
            // Click-move-click authoring: the anchor is already placed, the
            // release that follows commits.
            updateDraft(world);
            return;

        case InteractionState::Dragging:
        case InteractionState::DraggingVertex:
        case InteractionState::EditingParameters:
            return;
    }
}

void InteractionSession::onPointerMove(const WorldPoint& world) {
    switch (session_.state) {
        case InteractionState::Drawing:
        case InteractionState::Previewing:
            updateDraft(world);
            return;

        case InteractionState::Selected:
            if (session_.pressed && session_.dragArmed) {
                beginDrag(world);
            }
            return;

        case InteractionState::Dragging: {
            const WorldPoint delta{world.x - session_.lastPoint.x, world.y - session_.lastPoint.y};
            if (engine_.translate(session_.id, delta) == ObjectError::Ok) {
                session_.lastPoint = world;
            }
            return;
        }

        case InteractionState::DraggingVertex: {
            // Every step is derived from the press-time parameters: once a corner
            // crosses its anchor the regenerated order no longer matches vertexIndex.
            ShapeParameters next = session_.pressParams;
            const ObjectError err = pixeloid::deriveFromVertexEdit(
                session_.pressParams, static_cast<std::size_t>(session_.vertexIndex), world, next,
                engine_.store().circleSegments());
            if (err != ObjectError::Ok) {
                engine_.setError(err);
                PIXELOID_LOG_DEBUG("vertex drag ignored: %s", objectErrorName(err));
            } else if (engine_.updateByParameters(session_.id, next) != ObjectError::Ok) {
                PIXELOID_LOG_WARN("vertex drag: store rejected %s", session_.id.c_str());
            }
            session_.lastPoint = world;
            return;
        }

        case InteractionState::Idle:
        case InteractionState::EditingParameters:
            return;
    }
}

void InteractionSession::onPointerUp(const WorldPoint& world) {
    switch (session_.state) {
        case InteractionState::Drawing:
        case InteractionState::Previewing:
            commitDraft(world);
            return;

        case InteractionState::Selected:
            session_.pressed = false;
            session_.dragArmed = false;
            return;

        case InteractionState::Dragging:
        case InteractionState::DraggingVertex:
            session_.state = InteractionState::Selected;
            session_.vertexIndex = -1;
            session_.pressed = false;
            session_.dragArmed = false;
            return;

        case InteractionState::Idle:
        case InteractionState::EditingParameters:
            return;
    }
}

// ==============================================================================
// Keys
// ==============================================================================

void InteractionSession::handleKey(InteractionKey key, KeyPhase phase) {
    const bool down = phase == KeyPhase::Down;
    switch (key) {
        case InteractionKey::W: keyboardPan_.setHeld(PanDirection::Up, down); return;
        case InteractionKey::A: keyboardPan_.setHeld(PanDirection::Left, down); return;
        case InteractionKey::S: keyboardPan_.setHeld(PanDirection::Down, down); return;
        case InteractionKey::D: keyboardPan_.setHeld(PanDirection::Right, down); return;
        default: break;
    }
    if (!down) return;

    switch (key) {
        case InteractionKey::Escape:
            cancel();
            return;
        case InteractionKey::Delete:
            if (session_.state == InteractionState::Selected
                || session_.state == InteractionState::EditingParameters) {
                const std::string id = session_.id;
                // Removal notifies onObjectRemoved, which returns us to Idle.
                if (engine_.remove(id) != ObjectError::Ok) {
                    PIXELOID_LOG_WARN("delete: selected id %s no longer in store", id.c_str());
                    clearSelection();
                }
            }
            return;
        case InteractionKey::Space:
            recenter();
            return;
        default:
            return;
    }
}

bool InteractionSession::tick(double dtSeconds) {
    const WorldPoint before = engine_.navigation().panOffset();
    EngineState& st = engine_.state();
    keyboardPan_.setOptions(st.config.keyboardPan);
    if (!keyboardPan_.tick(dtSeconds, st.navigation)) return false;
    if (st.navigation.panOffset() == before) return false;
    engine_.recordViewChanged(static_cast<std::uint32_t>(pixeloid::protocol::ViewChangeMask::Pan));
    return true;
}

void InteractionSession::recenter() {
    const GeometricObject* obj = session_.id.empty() ? nullptr : engine_.get(session_.id);
    if (obj) {
        const WorldPoint center{(obj->bounds.minX + obj->bounds.maxX) * 0.5,
                                (obj->bounds.minY + obj->bounds.maxY) * 0.5};
        engine_.centerOn(center);
    } else {
        engine_.resetView();
    }
}

// ==============================================================================
// Selection / transforms
// ==============================================================================

void InteractionSession::setSelected(const std::string& id) {
    const bool changed = session_.id != id;
    session_.state = InteractionState::Selected;
    session_.id = id;
    session_.vertexIndex = -1;
    if (changed) engine_.recordSelectionChanged();
}

bool InteractionSession::select(const std::string& id) {
    if (!engine_.get(id)) return false;
    if (session_.state != InteractionState::Idle && session_.state != InteractionState::Selected) {
        cancel();
    }
    setSelected(id);
    session_.pressed = false;
    session_.dragArmed = false;
    return true;
}

void InteractionSession::clearSelection() {
    const bool changed = !session_.id.empty();
    session_ = SessionState{};
    if (changed) engine_.recordSelectionChanged();
}

void InteractionSession::beginDrag(const WorldPoint& world) {
    const GeometricObject* obj = engine_.get(session_.id);
    if (!obj) {
        clearSelection();
        return;
    }
    session_.pressParams = obj->parameters;
    session_.state = InteractionState::Dragging;

    const WorldPoint delta{world.x - session_.lastPoint.x, world.y - session_.lastPoint.y};
    if (engine_.translate(session_.id, delta) == ObjectError::Ok) {
        session_.lastPoint = world;
    }
}

void InteractionSession::beginVertexDrag(std::int32_t vertexIndex, const WorldPoint& world) {
    const GeometricObject* obj = engine_.get(session_.id);
    if (!obj) return;
    session_.pressParams = obj->parameters;
    session_.state = InteractionState::DraggingVertex;
    session_.vertexIndex = vertexIndex;
    session_.pressed = true;
    session_.lastPoint = world;
}

void InteractionSession::cancelTransform() {
    // Restore the exact press-time parameters; every drag step already went
    // through the store.
    const ObjectError err = engine_.updateByParameters(session_.id, session_.pressParams);
    if (err != ObjectError::Ok) {
        PIXELOID_LOG_WARN("cancelTransform: restore failed for %s (%s)",
                          session_.id.c_str(), objectErrorName(err));
    }
}

void InteractionSession::cancel() {
    switch (session_.state) {
        case InteractionState::Idle:
            return;
        case InteractionState::Drawing:
        case InteractionState::Previewing:
            cancelDraft();
            break;
        case InteractionState::Dragging:
        case InteractionState::DraggingVertex:
            cancelTransform();
            break;
        case InteractionState::Selected:
        case InteractionState::EditingParameters:
            break;
    }
    clearSelection();
}

// ==============================================================================
// Property editing
// ==============================================================================

bool InteractionSession::openPropertyEditor() {
    if (session_.state != InteractionState::Selected) return false;
    if (!engine_.get(session_.id)) return false;
    session_.state = InteractionState::EditingParameters;
    session_.pressed = false;
    session_.dragArmed = false;
    return true;
}

ObjectError InteractionSession::commitPropertyEdit(const ShapeParameters& params) {
    if (session_.state != InteractionState::EditingParameters) return ObjectError::UnknownObjectId;
    const ObjectError err = engine_.updateByParameters(session_.id, params);
    if (err == ObjectError::Ok) {
        session_.state = InteractionState::Selected;
    }
    return err;
}

void InteractionSession::cancelPropertyEdit() {
    if (session_.state != InteractionState::EditingParameters) return;
    session_.state = InteractionState::Selected;
}

// ==============================================================================
// Engine notifications
// ==============================================================================

void InteractionSession::onObjectRemoved(const std::string& id) {
    if (session_.id != id) return;
    if (draft_.active) cancelDraft();
    clearSelection();
}

// Vertex indices captured at press time are only meaningful for the sample
// count they were picked with.
void InteractionSession::onCircleSegmentsChanged() {
    if (session_.state != InteractionState::DraggingVertex) return;
    const GeometricObject* obj = engine_.get(session_.id);
    if (!obj || obj->kind != ShapeKind::Circle) return;
    PIXELOID_LOG_DEBUG("vertex drag on %s ended by segment change", session_.id.c_str());
    session_.state = InteractionState::Selected;
    session_.vertexIndex = -1;
    session_.pressed = false;
    session_.dragArmed = false;
}

void InteractionSession::reset() {
    draft_ = DraftState{};
    session_ = SessionState{};
    keyboardPan_.releaseAll();
}
