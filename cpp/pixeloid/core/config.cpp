#include "pixeloid/core/config.h"
#include "pixeloid/core/util.h"

namespace pixeloid {

namespace {
    bool isUnitInterval(double v) noexcept {
        return isFinite(v) && v >= 0.0 && v <= 1.0;
    }
}

bool isValidStyle(const StrokeStyle& style) noexcept {
    if (!isFinite(style.strokeWidth) || style.strokeWidth <= 0.0) return false;
    if (!isUnitInterval(style.strokeAlpha)) return false;
    if (style.fillAlpha && !isUnitInterval(*style.fillAlpha)) return false;
    return true;
}

bool validateConfig(const EngineConfig& config) noexcept {
    if (!isFinite(config.cellSizePx) || config.cellSizePx < interaction_constants::MIN_CELL_SIZE_PX) {
        return false;
    }
    if (!isFinite(config.pickTolerancePx) || config.pickTolerancePx < 0.0) return false;
    if (!isFinite(config.vertexHandleRadiusPx) || config.vertexHandleRadiusPx < 0.0) return false;

    const DrawingSettings& d = config.drawing;
    if (!isUnitInterval(d.previewOpacity)) return false;
    if (!isFinite(d.minDrawDistance) || d.minDrawDistance < 0.0) return false;
    if (d.circleSegments < 3) return false;

    if (!isFinite(config.keyboardPan.speed) || config.keyboardPan.speed < 0.0) return false;
    return isValidStyle(config.defaultStyle);
}

} // namespace pixeloid
