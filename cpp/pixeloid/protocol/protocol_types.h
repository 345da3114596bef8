#pragma once

#include <cstdint>

namespace pixeloid::protocol {

enum class EventType : std::uint16_t {
    Overflow = 1,
    DocChanged = 2,
    EntityChanged = 3,
    EntityCreated = 4,
    EntityDeleted = 5,
    SelectionChanged = 6,
    ViewChanged = 7,
};

enum class ChangeMask : std::uint32_t {
    Geometry = 1 << 0,
    Style = 1 << 1,
    Visibility = 1 << 2,
    Bounds = 1 << 3,
    Order = 1 << 4,
};

enum class ViewChangeMask : std::uint32_t {
    Pan = 1 << 0,
    CellSize = 1 << 1,
    Surface = 1 << 2,
};

// Fixed-size POD so a renderer can read the buffer straight out of linear memory.
// Entity events carry the numeric serial of the object id ("obj_<serial>").
struct EngineEvent {
    std::uint16_t type;
    std::uint16_t flags;
    std::uint32_t a;
    std::uint32_t b;
    std::uint32_t c;
    std::uint32_t d;
};

struct EventBufferMeta {
    std::uint32_t generation;
    std::uint32_t count;
    std::uintptr_t ptr;
};

} // namespace pixeloid::protocol
