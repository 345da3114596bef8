#include "pixeloid/engine.h"
#include "pixeloid/internal/engine_state.h"
#include "pixeloid/core/logging.h"
#include "pixeloid/viewport/viewport_window.h"

EngineState::EngineState(PixeloidEngine& engine, const EngineConfig& cfg)
    : config(cfg),
      navigation(cfg.cellSizePx),
      store(cfg.drawing.circleSegments),
      interactionSession(engine) {
    eventQueue.resize(kMaxEvents);
    eventBuffer.reserve(kMaxEvents);
}

static EngineConfig sanitizedConfig(const EngineConfig& config) {
    if (pixeloid::validateConfig(config)) return config;
    PIXELOID_LOG_WARN("PixeloidEngine: invalid config, falling back to defaults");
    return EngineConfig{};
}

PixeloidEngine::PixeloidEngine() : PixeloidEngine(EngineConfig{}) {}

PixeloidEngine::PixeloidEngine(const EngineConfig& config)
    : state_(std::make_unique<EngineState>(*this, sanitizedConfig(config))) {
    state().interactionSession.setDrawStyle(state().config.defaultStyle);
    state().interactionSession.keyboardPan().setOptions(state().config.keyboardPan);
}

PixeloidEngine::~PixeloidEngine() = default;

void PixeloidEngine::clear() noexcept {
    EngineState& st = state();
    st.interactionSession.reset();
    st.store.clear();
    st.lastError = ObjectError::Ok;
    clearEventState();
    st.generation++;
}

// ==============================================================================
// Configuration
// ==============================================================================

bool PixeloidEngine::setConfig(const EngineConfig& config) {
    if (!pixeloid::validateConfig(config)) {
        PIXELOID_LOG_WARN("setConfig: rejected invalid configuration");
        return false;
    }
    EngineState& st = state();
    const bool cellSizeChanged = config.cellSizePx != st.config.cellSizePx;
    const bool segmentsChanged = config.drawing.circleSegments != st.store.circleSegments();
    st.config = config;
    st.interactionSession.keyboardPan().setOptions(config.keyboardPan);

    if (segmentsChanged) {
        st.store.setCircleSegments(config.drawing.circleSegments);
        for (const GeometricObject& obj : st.store.all()) {
            if (obj.kind != ShapeKind::Circle) continue;
            recordEntityChanged(ObjectStore::serialOf(obj.id),
                static_cast<std::uint32_t>(ChangeMask::Geometry) | static_cast<std::uint32_t>(ChangeMask::Bounds));
        }
        st.interactionSession.onCircleSegmentsChanged();
    }
    if (cellSizeChanged) setCellSize(config.cellSizePx);
    return true;
}

const EngineConfig& PixeloidEngine::config() const noexcept {
    return state().config;
}

// ==============================================================================
// Navigation and coordinates
// ==============================================================================

bool PixeloidEngine::setCellSize(double px) {
    EngineState& st = state();
    if (!st.navigation.setCellSize(px)) {
        PIXELOID_LOG_DEBUG("setCellSize rejected: %f", px);
        return false;
    }
    st.config.cellSizePx = px;
    recordViewChanged(static_cast<std::uint32_t>(ViewChangeMask::CellSize));
    return true;
}

bool PixeloidEngine::pan(const WorldPoint& deltaWorld) {
    if (!state().navigation.pan(deltaWorld)) return false;
    recordViewChanged(static_cast<std::uint32_t>(ViewChangeMask::Pan));
    return true;
}

void PixeloidEngine::snapToCell() {
    state().navigation.snapToCell();
    recordViewChanged(static_cast<std::uint32_t>(ViewChangeMask::Pan));
}

bool PixeloidEngine::setSurfaceSize(double widthPx, double heightPx) {
    if (!pixeloid::isFinite(widthPx) || !pixeloid::isFinite(heightPx) || widthPx < 0.0 || heightPx < 0.0) {
        return false;
    }
    EngineState& st = state();
    st.surfaceWidth = widthPx;
    st.surfaceHeight = heightPx;
    recordViewChanged(static_cast<std::uint32_t>(ViewChangeMask::Surface));
    return true;
}

bool PixeloidEngine::centerOn(const WorldPoint& worldPoint) {
    EngineState& st = state();
    if (!st.navigation.centerOn(worldPoint, st.surfaceWidth, st.surfaceHeight)) return false;
    recordViewChanged(static_cast<std::uint32_t>(ViewChangeMask::Pan));
    return true;
}

void PixeloidEngine::resetView() {
    state().navigation.reset();
    recordViewChanged(static_cast<std::uint32_t>(ViewChangeMask::Pan));
}

const NavigationState& PixeloidEngine::navigation() const noexcept { return state().navigation; }
double PixeloidEngine::surfaceWidth() const noexcept { return state().surfaceWidth; }
double PixeloidEngine::surfaceHeight() const noexcept { return state().surfaceHeight; }

AABB PixeloidEngine::viewportWindow() const {
    const EngineState& st = state();
    return pixeloid::viewportWindow(st.navigation, st.surfaceWidth, st.surfaceHeight);
}

WorldPoint PixeloidEngine::toWorld(const ScreenPoint& s) const { return state().navigation.toWorld(s); }
ScreenPoint PixeloidEngine::toScreen(const WorldPoint& w) const { return state().navigation.toScreen(w); }
CellPoint PixeloidEngine::toCell(const ScreenPoint& s) const { return state().navigation.toCell(s); }

// ==============================================================================
// Input
// ==============================================================================

void PixeloidEngine::setDrawMode(std::optional<ShapeKind> kind) {
    state().interactionSession.setDrawMode(kind);
}

std::optional<ShapeKind> PixeloidEngine::drawMode() const {
    return state().interactionSession.drawMode();
}

void PixeloidEngine::setDrawStyle(const StrokeStyle& style) {
    if (!pixeloid::isValidStyle(style)) {
        PIXELOID_LOG_WARN("setDrawStyle: rejected invalid style");
        setError(ObjectError::InvalidParameters);
        return;
    }
    state().interactionSession.setDrawStyle(style);
}

void PixeloidEngine::handlePointer(const PointerEvent& ev) {
    state().interactionSession.handlePointer(ev);
}

void PixeloidEngine::handleKey(InteractionKey key, KeyPhase phase) {
    state().interactionSession.handleKey(key, phase);
}

void PixeloidEngine::tick(double dtSeconds) {
    state().interactionSession.tick(dtSeconds);
}

bool PixeloidEngine::selectShape(const std::string& id) {
    return state().interactionSession.select(id);
}

void PixeloidEngine::clearSelection() {
    state().interactionSession.cancel();
}

bool PixeloidEngine::openPropertyEditor() {
    return state().interactionSession.openPropertyEditor();
}

ObjectError PixeloidEngine::commitPropertyEdit(const ShapeParameters& params) {
    return state().interactionSession.commitPropertyEdit(params);
}

void PixeloidEngine::cancelPropertyEdit() {
    state().interactionSession.cancelPropertyEdit();
}

InteractionState PixeloidEngine::interactionState() const noexcept {
    return state().interactionSession.state();
}

const std::string& PixeloidEngine::selectedId() const noexcept {
    return state().interactionSession.selectedId();
}

std::uint32_t PixeloidEngine::generation() const noexcept {
    return state().generation;
}
