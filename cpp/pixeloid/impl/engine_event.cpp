// PixeloidEngine event stream methods
// Changes are coalesced per object between polls and flushed in a fixed order.

#include "pixeloid/engine.h"
#include "pixeloid/internal/engine_state.h"
#include <algorithm>
#include <string>
#include <type_traits>
#include <vector>

void PixeloidEngine::clearPending() {
    EngineState& st = state();
    st.pendingEntityChanges.clear();
    st.pendingEntityCreates.clear();
    st.pendingEntityDeletes.clear();
    st.pendingDocMask = 0;
    st.pendingViewMask = 0;
    st.pendingSelectionChanged = false;
}

void PixeloidEngine::clearEventState() {
    EngineState& st = state();
    st.eventHead = 0;
    st.eventTail = 0;
    st.eventCount = 0;
    st.eventOverflowed = false;
    st.eventOverflowGeneration = 0;
    clearPending();
}

void PixeloidEngine::recordDocChanged(std::uint32_t mask) {
    EngineState& st = state();
    if (st.eventOverflowed) return;
    st.pendingDocMask |= mask;
}

void PixeloidEngine::recordEntityChanged(std::uint32_t serial, std::uint32_t mask) {
    EngineState& st = state();
    if (st.eventOverflowed) return;
    if (st.pendingEntityDeletes.find(serial) != st.pendingEntityDeletes.end()) return;
    // A create not yet polled already tells the consumer everything.
    if (st.pendingEntityCreates.find(serial) == st.pendingEntityCreates.end()) {
        st.pendingEntityChanges[serial] |= mask;
    }
    recordDocChanged(mask);
}

void PixeloidEngine::recordEntityCreated(std::uint32_t serial, std::uint32_t kind) {
    EngineState& st = state();
    if (st.eventOverflowed) return;
    st.pendingEntityDeletes.erase(serial);
    st.pendingEntityChanges.erase(serial);
    st.pendingEntityCreates[serial] = kind;
    recordDocChanged(
        static_cast<std::uint32_t>(ChangeMask::Geometry)
        | static_cast<std::uint32_t>(ChangeMask::Style)
        | static_cast<std::uint32_t>(ChangeMask::Bounds)
        | static_cast<std::uint32_t>(ChangeMask::Order));
}

void PixeloidEngine::recordEntityDeleted(std::uint32_t serial) {
    EngineState& st = state();
    if (st.eventOverflowed) return;
    st.pendingEntityChanges.erase(serial);
    // Created and deleted inside one poll window: the consumer never saw it.
    if (st.pendingEntityCreates.erase(serial) == 0) {
        st.pendingEntityDeletes.insert(serial);
    }
    recordDocChanged(
        static_cast<std::uint32_t>(ChangeMask::Geometry)
        | static_cast<std::uint32_t>(ChangeMask::Bounds)
        | static_cast<std::uint32_t>(ChangeMask::Order));
}

void PixeloidEngine::recordSelectionChanged() {
    EngineState& st = state();
    if (st.eventOverflowed) return;
    st.pendingSelectionChanged = true;
}

void PixeloidEngine::recordViewChanged(std::uint32_t mask) {
    EngineState& st = state();
    if (st.eventOverflowed) return;
    st.pendingViewMask |= mask;
}

bool PixeloidEngine::pushEvent(const EngineEvent& ev) {
    EngineState& st = state();
    if (st.eventOverflowed) return false;
    if (st.eventCount >= EngineState::kMaxEvents) {
        st.eventOverflowed = true;
        st.eventOverflowGeneration = st.generation;
        st.eventHead = 0;
        st.eventTail = 0;
        st.eventCount = 0;
        return false;
    }
    st.eventQueue[st.eventTail] = ev;
    st.eventTail = (st.eventTail + 1) % EngineState::kMaxEvents;
    st.eventCount++;
    return true;
}

void PixeloidEngine::flushPendingEvents() {
    EngineState& st = state();
    if (st.eventOverflowed) {
        clearPending();
        return;
    }

    if (st.pendingDocMask == 0 &&
        st.pendingViewMask == 0 &&
        st.pendingEntityChanges.empty() &&
        st.pendingEntityCreates.empty() &&
        st.pendingEntityDeletes.empty() &&
        !st.pendingSelectionChanged) {
        return;
    }

    auto pushOrOverflow = [&](const EngineEvent& ev) -> bool {
        if (!pushEvent(ev)) {
            clearPending();
            return false;
        }
        return true;
    };

    auto sortedKeys = [](const auto& container) {
        std::vector<std::uint32_t> ids;
        ids.reserve(container.size());
        for (const auto& entry : container) {
            if constexpr (std::is_same_v<std::decay_t<decltype(entry)>, std::uint32_t>) {
                ids.push_back(entry);
            } else {
                ids.push_back(entry.first);
            }
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    };

    if (st.pendingDocMask != 0) {
        if (!pushOrOverflow(EngineEvent{
                static_cast<std::uint16_t>(EventType::DocChanged), 0, st.pendingDocMask, 0, 0, 0})) {
            return;
        }
    }

    for (const std::uint32_t serial : sortedKeys(st.pendingEntityCreates)) {
        if (!pushOrOverflow(EngineEvent{
                static_cast<std::uint16_t>(EventType::EntityCreated), 0, serial,
                st.pendingEntityCreates[serial], 0, 0})) {
            return;
        }
    }

    for (const std::uint32_t serial : sortedKeys(st.pendingEntityChanges)) {
        if (!pushOrOverflow(EngineEvent{
                static_cast<std::uint16_t>(EventType::EntityChanged), 0, serial,
                st.pendingEntityChanges[serial], 0, 0})) {
            return;
        }
    }

    for (const std::uint32_t serial : sortedKeys(st.pendingEntityDeletes)) {
        if (!pushOrOverflow(EngineEvent{
                static_cast<std::uint16_t>(EventType::EntityDeleted), 0, serial, 0, 0, 0})) {
            return;
        }
    }

    if (st.pendingSelectionChanged) {
        const std::string& selected = st.interactionSession.selectedId();
        if (!pushOrOverflow(EngineEvent{
                static_cast<std::uint16_t>(EventType::SelectionChanged), 0,
                ObjectStore::serialOf(selected), selected.empty() ? 0u : 1u, 0, 0})) {
            return;
        }
    }

    if (st.pendingViewMask != 0) {
        if (!pushOrOverflow(EngineEvent{
                static_cast<std::uint16_t>(EventType::ViewChanged), 0, st.pendingViewMask, 0, 0, 0})) {
            return;
        }
    }

    clearPending();
}

PixeloidEngine::EventBufferMeta PixeloidEngine::pollEvents(std::uint32_t maxEvents) {
    flushPendingEvents();

    EngineState& st = state();
    st.eventBuffer.clear();
    if (st.eventOverflowed) {
        st.eventBuffer.push_back(EngineEvent{
            static_cast<std::uint16_t>(EventType::Overflow), 0, st.eventOverflowGeneration, 0, 0, 0});
        return EventBufferMeta{
            st.generation,
            static_cast<std::uint32_t>(st.eventBuffer.size()),
            reinterpret_cast<std::uintptr_t>(st.eventBuffer.data()),
        };
    }

    if (st.eventCount == 0 || maxEvents == 0) {
        return EventBufferMeta{st.generation, 0, 0};
    }

    const std::size_t count = std::min<std::size_t>(maxEvents, st.eventCount);
    st.eventBuffer.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        st.eventBuffer.push_back(st.eventQueue[st.eventHead]);
        st.eventHead = (st.eventHead + 1) % EngineState::kMaxEvents;
        st.eventCount--;
    }

    return EventBufferMeta{
        st.generation,
        static_cast<std::uint32_t>(st.eventBuffer.size()),
        reinterpret_cast<std::uintptr_t>(st.eventBuffer.data()),
    };
}

void PixeloidEngine::ackResync(std::uint32_t resyncGeneration) {
    EngineState& st = state();
    if (!st.eventOverflowed) return;
    if (resyncGeneration < st.eventOverflowGeneration) return;
    clearEventState();
}
