/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EVENT_DISPATCHER_HPP
#define EVENT_DISPATCHER_HPP

#include "events/GameEvent.hpp"
#include <cstddef>
#include <vector>

namespace TesselEngine {

/**
 * @brief Synchronous, ordered event fan-out
 *
 * Listeners are non-owning and must outlive their registration. Every listener
 * sees every event, in registration order, whether or not an earlier one
 * consumed it. An exception thrown by a listener stops the dispatch and
 * propagates to the caller.
 */
class EventDispatcher {
public:
    EventDispatcher() = default;
    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    /**
     * @brief Registers a listener; registering the same listener twice is ignored
     */
    void addListener(IEventListener& listener);

    /**
     * @brief Unregisters a listener
     * @return false if the listener was not registered
     */
    bool removeListener(IEventListener& listener);

    /**
     * @brief Delivers event to every listener
     * @return Number of listeners that consumed the event; 0 when called re-entrantly
     */
    size_t dispatch(const GameEvent& event);

    size_t getListenerCount() const { return m_listeners.size(); }
    bool isDispatching() const { return m_dispatching; }

private:
    std::vector<IEventListener*> m_listeners;
    bool m_dispatching{false};
};

} // namespace TesselEngine

#endif // EVENT_DISPATCHER_HPP
