#pragma once

#include "pixeloid/core/config.h"
#include "pixeloid/coords/navigation_state.h"
#include "pixeloid/interaction/interaction_session.h"
#include "pixeloid/interaction/pick_system.h"
#include "pixeloid/protocol/protocol_types.h"
#include "pixeloid/store/object_store.h"

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <vector>

class PixeloidEngine;

struct EngineState {
    EngineState(PixeloidEngine& engine, const EngineConfig& cfg);

    EngineState(const EngineState&) = delete;
    EngineState& operator=(const EngineState&) = delete;

    EngineConfig config;
    NavigationState navigation;
    ObjectStore store;
    PickSystem pickSystem;

    double surfaceWidth{0.0};
    double surfaceHeight{0.0};

    std::uint32_t generation{0};
    mutable ObjectError lastError{ObjectError::Ok};

    static constexpr std::size_t kMaxEvents = 2048;
    std::vector<pixeloid::protocol::EngineEvent> eventQueue{};
    std::size_t eventHead{0};
    std::size_t eventTail{0};
    std::size_t eventCount{0};
    bool eventOverflowed{false};
    std::uint32_t eventOverflowGeneration{0};
    std::vector<pixeloid::protocol::EngineEvent> eventBuffer{};

    std::unordered_map<std::uint32_t, std::uint32_t> pendingEntityChanges{};
    std::unordered_map<std::uint32_t, std::uint32_t> pendingEntityCreates{};
    std::unordered_set<std::uint32_t> pendingEntityDeletes{};
    std::uint32_t pendingDocMask{0};
    std::uint32_t pendingViewMask{0};
    bool pendingSelectionChanged{false};

    InteractionSession interactionSession;
};
