/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "events/EventDispatcher.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <type_traits>

namespace TesselEngine {

namespace {

// Resets the dispatching flag on every exit path, including a throwing listener
class DispatchScope {
public:
    explicit DispatchScope(bool& flag) : m_flag(flag) { m_flag = true; }
    ~DispatchScope() { m_flag = false; }
    DispatchScope(const DispatchScope&) = delete;
    DispatchScope& operator=(const DispatchScope&) = delete;

private:
    bool& m_flag;
};

const char* eventName(const GameEvent& event) {
    return std::visit([](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, MapChangeEvent>) {
            return "MapChangeEvent";
        } else {
            return "UnknownEvent";
        }
    }, event);
}

} // anonymous namespace

void EventDispatcher::addListener(IEventListener& listener) {
    if (std::find(m_listeners.begin(), m_listeners.end(), &listener) != m_listeners.end()) {
        EVENT_WARN("Listener already registered, ignoring");
        return;
    }
    m_listeners.push_back(&listener);
}

bool EventDispatcher::removeListener(IEventListener& listener) {
    if (m_dispatching) {
        EVENT_ERROR("Cannot remove a listener while dispatching");
        return false;
    }
    auto it = std::find(m_listeners.begin(), m_listeners.end(), &listener);
    if (it == m_listeners.end()) {
        return false;
    }
    m_listeners.erase(it);
    return true;
}

size_t EventDispatcher::dispatch(const GameEvent& event) {
    if (m_dispatching) {
        EVENT_ERROR(std::format("Rejected re-entrant dispatch of {}", eventName(event)));
        return 0;
    }

    DispatchScope scope(m_dispatching);
    // Snapshot so a listener registering another one does not invalidate iteration
    const std::vector<IEventListener*> listeners = m_listeners;

    size_t consumed = 0;
    for (IEventListener* listener : listeners) {
        if (listener->handle(event)) {
            ++consumed;
        }
    }

    EVENT_DEBUG(std::format("{} delivered to {} listeners, {} consumed",
                            eventName(event), listeners.size(), consumed));
    return consumed;
}

} // namespace TesselEngine
