// InteractionSession draft (ephemeral preview) methods
// Split from interaction_session.cpp; nothing here writes to the store except commitDraft.

#include "pixeloid/interaction/interaction_session.h"
#include "pixeloid/engine.h"
#include "pixeloid/internal/engine_state.h"
#include "pixeloid/geometry/shape_authoring.h"
#include "pixeloid/geometry/shape_generators.h"
#include "pixeloid/core/logging.h"
#include <cmath>

void InteractionSession::beginDraft(ShapeKind kind, const WorldPoint& world) {
    const DrawingSettings& settings = engine_.config().drawing;
    const WorldPoint anchor = pixeloid::snapAuthoringPoint(world, kind, settings);

    draft_.active = true;
    draft_.kind = kind;
    draft_.anchor = anchor;
    draft_.current = anchor;
    draft_.moved = false;

    session_.state = InteractionState::Drawing;
    session_.pressed = true;
}

void InteractionSession::updateDraft(const WorldPoint& world) {
    if (!draft_.active) return;
    draft_.current = pixeloid::snapAuthoringPoint(world, draft_.kind, engine_.config().drawing);
    draft_.moved = true;
    session_.state = InteractionState::Previewing;
}

ShapeParameters InteractionSession::draftParameters() const {
    return pixeloid::parametersFromDrag(draft_.kind, draft_.anchor, draft_.current);
}

bool InteractionSession::commitDraft(const WorldPoint& world) {
    if (!draft_.active) return false;
    draft_.current = pixeloid::snapAuthoringPoint(world, draft_.kind, engine_.config().drawing);
    session_.pressed = false;

    if (draft_.kind != ShapeKind::Point) {
        const double travel = std::hypot(draft_.current.x - draft_.anchor.x, draft_.current.y - draft_.anchor.y);
        if (!(travel > engine_.config().drawing.minDrawDistance)) {
            // Too short to author anything; keep the anchor and wait for more input.
            return false;
        }
    }

    const CreateResult res = engine_.create(draft_.kind, draftParameters(), drawStyle_);
    if (!res.ok()) {
        PIXELOID_LOG_DEBUG("commitDraft ignored: %s %s", shapeKindName(draft_.kind), objectErrorName(res.error));
        return false;
    }

    draft_ = DraftState{};
    session_ = SessionState{};
    return true;
}

void InteractionSession::cancelDraft() {
    if (draft_.active) {
        PIXELOID_LOG_DEBUG("draft cancelled: %s", shapeKindName(draft_.kind));
    }
    draft_ = DraftState{};
}

std::optional<GeometricObject> InteractionSession::currentPreview() const {
    if (!draft_.active || session_.state != InteractionState::Previewing) return std::nullopt;

    const ShapeParameters params = draftParameters();
    if (pixeloid::validateParameters(params) != ObjectError::Ok) return std::nullopt;

    const EngineConfig& cfg = engine_.config();
    StrokeStyle style = drawStyle_;
    style.strokeAlpha *= cfg.drawing.previewOpacity;
    if (style.fillAlpha) *style.fillAlpha *= cfg.drawing.previewOpacity;

    GeometricObject preview{};
    preview.id = "preview";
    preview.kind = draft_.kind;
    preview.parameters = params;
    preview.vertices = pixeloid::generateVertices(params, cfg.drawing.circleSegments);
    preview.bounds = pixeloid::computeBounds(preview.vertices);
    preview.style = style;
    preview.visible = true;
    preview.createdAt = 0.0;
    return preview;
}
