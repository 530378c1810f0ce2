/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_HPP
#define WORLD_HPP

#include "animation/AnimationCache.hpp"
#include "core/EngineConfig.hpp"
#include "entities/EntityRegistry.hpp"
#include "events/EventDispatcher.hpp"
#include "systems/AnimationSystem.hpp"
#include "systems/EntitySpawnSystem.hpp"
#include "systems/RenderSystem.hpp"
#include "systems/SpawnResolver.hpp"
#include <array>
#include <cstdint>
#include <memory>

namespace TesselEngine {

class IAssetCatalog;
class IPresentationSurface;
class ITileLayerRenderer;

/**
 * @brief Owns the entity registry and the systems of one game session
 *
 * Tick order is fixed: AnimationSystem, RenderSystem, EntitySpawnSystem, then
 * the deferred destruction queue is flushed. Entities spawned in a tick are
 * therefore first animated and drawn on the following tick.
 *
 * Map change listeners run in the order RenderSystem, EntitySpawnSystem,
 * SpawnResolver, AnimationSystem.
 *
 * The catalog, surface and tile renderer must outlive the World.
 */
class World {
public:
    World(const EngineConfig& config, const IAssetCatalog& catalog,
          IPresentationSurface& surface, ITileLayerRenderer& tileRenderer);
    ~World();

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    /**
     * @brief Runs one tick
     *
     * Every system runs even when an earlier one throws. The first exception
     * propagates after the destruction queue is flushed, and the tick is not
     * counted.
     */
    void update(float deltaTime);

    /**
     * @brief Makes map the active map and notifies every listener synchronously
     * @throws ConfigError from the SpawnResolver for a map without entities layer
     */
    void changeMap(std::shared_ptr<const TileMap> map);

    const std::shared_ptr<const TileMap>& getCurrentMap() const { return m_currentMap; }
    const EngineConfig& getConfig() const { return m_config; }
    EntityRegistry& getRegistry() { return m_registry; }
    const EntityRegistry& getRegistry() const { return m_registry; }
    AnimationCache& getAnimationCache() { return m_animationCache; }
    EventDispatcher& getDispatcher() { return m_dispatcher; }
    RenderSystem& getRenderSystem() { return m_renderSystem; }
    EntitySpawnSystem& getSpawnSystem() { return m_spawnSystem; }
    uint64_t getTickCount() const { return m_tickCount; }

private:
    EngineConfig m_config;
    EntityRegistry m_registry;
    AnimationCache m_animationCache;
    EventDispatcher m_dispatcher;

    AnimationSystem m_animationSystem;
    RenderSystem m_renderSystem;
    EntitySpawnSystem m_spawnSystem;
    SpawnResolver m_spawnResolver;

    std::array<ISystem*, 3> m_systems;
    std::shared_ptr<const TileMap> m_currentMap;
    uint64_t m_tickCount{0};
};

} // namespace TesselEngine

#endif // WORLD_HPP
