/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_EVENT_HPP
#define GAME_EVENT_HPP

#include "world/TileMap.hpp"
#include <memory>
#include <variant>

namespace TesselEngine {

/**
 * @brief Fired when a new map becomes active
 *
 * Listeners may hold on to the map; it stays alive as long as any of them does.
 */
struct MapChangeEvent {
    std::shared_ptr<const TileMap> map;
};

using GameEvent = std::variant<MapChangeEvent>;

/**
 * @brief Receives events from an EventDispatcher
 */
class IEventListener {
public:
    virtual ~IEventListener() = default;

    /**
     * @brief Handles one event
     * @return true when the listener consumed the event
     */
    virtual bool handle(const GameEvent& event) = 0;
};

} // namespace TesselEngine

#endif // GAME_EVENT_HPP
