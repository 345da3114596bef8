#ifndef PIXELOID_CORE_CONFIG_H
#define PIXELOID_CORE_CONFIG_H

#include "pixeloid/core/types.h"
#include "pixeloid/coords/anchor.h"
#include "pixeloid/interaction/interaction_constants.h"

#include <cstdint>

// Drawing behaviour the UI layer configures. The engine reads it, never owns it.
struct DrawingSettings {
    bool snapToAnchor = false;
    double previewOpacity = interaction_constants::PREVIEW_OPACITY;
    double minDrawDistance = interaction_constants::MIN_DRAW_DISTANCE;
    std::uint32_t circleSegments = interaction_constants::DEFAULT_CIRCLE_SEGMENTS;

    // Default anchor used for the first authored point of each kind.
    AnchorPoint pointAnchor = AnchorPoint::Center;
    AnchorPoint lineAnchor = AnchorPoint::Center;
    AnchorPoint circleAnchor = AnchorPoint::Center;
    AnchorPoint rectangleAnchor = AnchorPoint::TopLeft;
    AnchorPoint diamondAnchor = AnchorPoint::LeftMid;

    AnchorPoint anchorFor(ShapeKind kind) const noexcept {
        switch (kind) {
            case ShapeKind::Point: return pointAnchor;
            case ShapeKind::Line: return lineAnchor;
            case ShapeKind::Circle: return circleAnchor;
            case ShapeKind::Rectangle: return rectangleAnchor;
            case ShapeKind::Diamond: return diamondAnchor;
        }
        return AnchorPoint::Center;
    }
};

struct KeyboardPanOptions {
    double speed = interaction_constants::PAN_SPEED_PIXELOIDS_PER_SEC;
    bool snapOnRelease = true;
};

struct EngineConfig {
    double cellSizePx = interaction_constants::DEFAULT_CELL_SIZE_PX;
    double pickTolerancePx = interaction_constants::PICK_TOLERANCE_PX;
    double vertexHandleRadiusPx = interaction_constants::VERTEX_HANDLE_RADIUS_PX;
    DrawingSettings drawing{};
    KeyboardPanOptions keyboardPan{};
    StrokeStyle defaultStyle{0x0066cc, 2.0, 1.0, std::nullopt, std::nullopt};
};

namespace pixeloid {

// Style accepted by the store: finite positive width, alphas within [0, 1].
bool isValidStyle(const StrokeStyle& style) noexcept;

// True when every setting is usable. Invalid configs are refused by the engine.
bool validateConfig(const EngineConfig& config) noexcept;

} // namespace pixeloid

#endif // PIXELOID_CORE_CONFIG_H
