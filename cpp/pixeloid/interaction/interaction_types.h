#pragma once

#include "pixeloid/core/types.h"
#include <cstdint>

enum class InteractionState : std::uint8_t {
    Idle = 0,
    Drawing = 1,            // anchor placed, no movement yet
    Previewing = 2,         // anchor + current point, ephemeral preview live
    Selected = 3,
    Dragging = 4,           // whole-shape translate
    DraggingVertex = 5,     // single handle, re-derived from press-time parameters
    EditingParameters = 6,  // property panel open on the selected shape
};

enum class PointerPhase : std::uint8_t {
    Down = 0,
    Move = 1,
    Up = 2,
};

enum class PointerButton : std::uint8_t {
    Primary = 0,
    Middle = 1,
    Secondary = 2,
};

struct PointerEvent {
    ScreenPoint screenPoint;
    PointerButton button;
    PointerPhase phase;
};

enum class InteractionKey : std::uint8_t {
    Escape = 0,
    Delete = 1,
    Space = 2,
    W = 3,
    A = 4,
    S = 5,
    D = 6,
};

enum class KeyPhase : std::uint8_t {
    Down = 0,
    Up = 1,
};
