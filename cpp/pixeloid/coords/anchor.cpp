#include "pixeloid/coords/anchor.h"
#include <cmath>

namespace pixeloid {

WorldPoint anchorOffset(AnchorPoint anchor) {
    switch (anchor) {
        case AnchorPoint::TopLeft:     return {0.0, 0.0};
        case AnchorPoint::TopMid:      return {0.5, 0.0};
        case AnchorPoint::TopRight:    return {1.0, 0.0};
        case AnchorPoint::LeftMid:     return {0.0, 0.5};
        case AnchorPoint::Center:      return {0.5, 0.5};
        case AnchorPoint::RightMid:    return {1.0, 0.5};
        case AnchorPoint::BottomLeft:  return {0.0, 1.0};
        case AnchorPoint::BottomMid:   return {0.5, 1.0};
        case AnchorPoint::BottomRight: return {1.0, 1.0};
    }
    return {0.0, 0.0};
}

WorldPoint snapToAnchor(const WorldPoint& p, AnchorPoint anchor) {
    const WorldPoint offset = anchorOffset(anchor);
    return { std::floor(p.x) + offset.x, std::floor(p.y) + offset.y };
}

const char* anchorPointName(AnchorPoint anchor) {
    switch (anchor) {
        case AnchorPoint::TopLeft:     return "top-left";
        case AnchorPoint::TopMid:      return "top-mid";
        case AnchorPoint::TopRight:    return "top-right";
        case AnchorPoint::LeftMid:     return "left-mid";
        case AnchorPoint::Center:      return "center";
        case AnchorPoint::RightMid:    return "right-mid";
        case AnchorPoint::BottomLeft:  return "bottom-left";
        case AnchorPoint::BottomMid:   return "bottom-mid";
        case AnchorPoint::BottomRight: return "bottom-right";
    }
    return "unknown";
}

} // namespace pixeloid
