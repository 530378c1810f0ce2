/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPAWN_RESOLVER_HPP
#define SPAWN_RESOLVER_HPP

#include "events/GameEvent.hpp"

namespace TesselEngine {

class EntityRegistry;
struct EngineConfig;
struct MapObject;
struct SpawnRequest;

/**
 * @brief Reads the entities object layer of a new map into SpawnRequest entities
 *
 * Event-only: does no per-tick work. Object coordinates are converted from
 * map pixels to world units; the optional "color" property becomes the tint.
 */
class SpawnResolver : public IEventListener {
public:
    SpawnResolver(EntityRegistry& registry, const EngineConfig& config);

    /**
     * @brief Creates one spawn request per object of the entities layer
     * @return true for a MapChangeEvent
     * @throws ConfigError if the layer is missing or an object has no type
     */
    bool handle(const GameEvent& event) override;

    /**
     * @brief Builds the request for one map object without registering it
     * @throws ConfigError if the object has no type
     */
    SpawnRequest resolve(const MapObject& object) const;

private:
    EntityRegistry& m_registry;
    const EngineConfig& m_config;
};

} // namespace TesselEngine

#endif // SPAWN_RESOLVER_HPP
