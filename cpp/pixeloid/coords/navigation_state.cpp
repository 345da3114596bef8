#include "pixeloid/coords/navigation_state.h"
#include "pixeloid/coords/coordinate_transform.h"
#include "pixeloid/core/logging.h"
#include "pixeloid/core/util.h"
#include <cmath>

NavigationState::NavigationState(double cellSizePx) {
    if (!setCellSize(cellSizePx)) {
        PIXELOID_LOG_WARN("NavigationState: rejected cell size %f, keeping default", cellSizePx);
    }
}

bool NavigationState::pan(const WorldPoint& deltaWorld) {
    if (!pixeloid::isFinite(deltaWorld.x) || !pixeloid::isFinite(deltaWorld.y)) {
        return false;
    }
    panOffset_.x += deltaWorld.x;
    panOffset_.y += deltaWorld.y;
    return true;
}

void NavigationState::snapToCell() {
    panOffset_.x = std::round(panOffset_.x);
    panOffset_.y = std::round(panOffset_.y);
    PIXELOID_LOG_DEBUG("snapToCell -> (%f, %f)", panOffset_.x, panOffset_.y);
}

bool NavigationState::setCellSize(double px) {
    if (!pixeloid::isFinite(px) || px <= 0.0 || px < interaction_constants::MIN_CELL_SIZE_PX) {
        return false;
    }
    cellSizePx_ = px;
    return true;
}

bool NavigationState::centerOn(const WorldPoint& worldPoint, double surfaceWidthPx, double surfaceHeightPx) {
    if (!pixeloid::isFinite(worldPoint.x) || !pixeloid::isFinite(worldPoint.y)) return false;
    if (!pixeloid::isFinite(surfaceWidthPx) || !pixeloid::isFinite(surfaceHeightPx)) return false;
    panOffset_.x = worldPoint.x - (surfaceWidthPx * 0.5) / cellSizePx_;
    panOffset_.y = worldPoint.y - (surfaceHeightPx * 0.5) / cellSizePx_;
    return true;
}

WorldPoint NavigationState::toWorld(const ScreenPoint& s) const {
    return pixeloid::screenToWorld(s, cellSizePx_, panOffset_);
}

ScreenPoint NavigationState::toScreen(const WorldPoint& w) const {
    return pixeloid::worldToScreen(w, cellSizePx_, panOffset_);
}

CellPoint NavigationState::toCell(const ScreenPoint& s) const {
    return pixeloid::screenToCell(s, cellSizePx_, panOffset_);
}

// =============================================================================
// KeyboardPanController
// =============================================================================

void KeyboardPanController::setHeld(PanDirection dir, bool held) {
    held_[static_cast<std::size_t>(dir)] = held;
}

bool KeyboardPanController::anyHeld() const noexcept {
    for (const bool h : held_) {
        if (h) return true;
    }
    return false;
}

void KeyboardPanController::releaseAll() noexcept {
    held_.fill(false);
}

bool KeyboardPanController::tick(double dtSeconds, NavigationState& nav) {
    const bool moving = anyHeld();

    if (moving) {
        wasMoving_ = true;
        if (!pixeloid::isFinite(dtSeconds) || dtSeconds <= 0.0) return false;

        const double step = options_.speed * dtSeconds;
        WorldPoint delta{0.0, 0.0};
        if (isHeld(PanDirection::Up)) delta.y -= step;
        if (isHeld(PanDirection::Down)) delta.y += step;
        if (isHeld(PanDirection::Left)) delta.x -= step;
        if (isHeld(PanDirection::Right)) delta.x += step;
        if (delta.x == 0.0 && delta.y == 0.0) return false;
        return nav.pan(delta);
    }

    if (wasMoving_) {
        wasMoving_ = false;
        if (options_.snapOnRelease) {
            nav.snapToCell();
            return true;
        }
    }
    return false;
}
