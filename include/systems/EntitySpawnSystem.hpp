/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_SPAWN_SYSTEM_HPP
#define ENTITY_SPAWN_SYSTEM_HPP

#include "entities/Components.hpp"
#include "entities/EntityHandle.hpp"
#include "events/GameEvent.hpp"
#include "systems/ISystem.hpp"
#include "utils/Vector2D.hpp"
#include <boost/container/flat_map.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace TesselEngine {

class EntityRegistry;
class IAssetCatalog;
struct EngineConfig;

/**
 * @brief Turns pending SpawnRequest entities into animated, renderable entities
 *
 * Spawn configs and reference sizes are cached for the lifetime of the
 * system. Each request is consumed in the tick it is seen, whether or not
 * materializing it succeeds.
 */
class EntitySpawnSystem : public ISystem, public IEventListener {
public:
    EntitySpawnSystem(EntityRegistry& registry, const IAssetCatalog& catalog,
                      const EngineConfig& config);

    /**
     * @brief Consumes and materializes every pending spawn request
     * @throws The first ConfigError or AssetError from materialize(), after
     *         every other request of the batch has been materialized
     */
    void update(float deltaTime) override;
    const char* getName() const override { return "EntitySpawnSystem"; }

    /**
     * @brief Queues destruction of everything spawned for the previous map,
     *        including requests not materialized yet
     * @return false, the event is left for the SpawnResolver
     */
    bool handle(const GameEvent& event) override;

    /**
     * @brief Resolves the spawn config of an entity type, caching the result
     * @throws ConfigError("spawn type must be specified") for a blank type
     */
    SpawnConfig spawnConfig(const std::string& entityType);

    /**
     * @brief World size of the first idle frame of atlasKey, cached per key
     * @throws AssetError("no regions for atlas key <atlasKey>")
     */
    Vector2D referenceSize(const std::string& atlasKey);

    /**
     * @brief Creates the visual entity for one request
     *
     * Config and size are resolved before anything is created, so a failure
     * leaves no entity behind.
     */
    EntityHandle materialize(const SpawnRequest& request);

    size_t getCachedConfigCount() const { return m_configCache.size(); }
    size_t getCachedSizeCount() const { return m_sizeCache.size(); }

private:
    EntityRegistry& m_registry;
    const IAssetCatalog& m_catalog;
    const EngineConfig& m_config;

    boost::container::flat_map<std::string, SpawnConfig> m_configCache;
    boost::container::flat_map<std::string, Vector2D> m_sizeCache;
    std::vector<EntityHandle> m_spawned;
};

} // namespace TesselEngine

#endif // ENTITY_SPAWN_SYSTEM_HPP
