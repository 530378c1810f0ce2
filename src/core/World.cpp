/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/World.hpp"
#include "core/Logger.hpp"
#include <exception>
#include <format>

namespace TesselEngine {

World::World(const EngineConfig& config, const IAssetCatalog& catalog,
             IPresentationSurface& surface, ITileLayerRenderer& tileRenderer)
    : m_config(config),
      m_registry(surface),
      m_animationCache(catalog, m_config.frameDuration),
      m_animationSystem(m_registry, m_animationCache),
      m_renderSystem(m_registry, surface, tileRenderer, m_config),
      m_spawnSystem(m_registry, catalog, m_config),
      m_spawnResolver(m_registry, m_config),
      m_systems{&m_animationSystem, &m_renderSystem, &m_spawnSystem} {
    m_dispatcher.addListener(m_renderSystem);
    m_dispatcher.addListener(m_spawnSystem);
    m_dispatcher.addListener(m_spawnResolver);
    m_dispatcher.addListener(m_animationSystem);
    WORLD_INFO("World created");
}

World::~World() {
    WORLD_DEBUG(std::format("World destroyed after {} ticks, {} entities alive",
                            m_tickCount, m_registry.getEntityCount()));
}

void World::update(float deltaTime) {
    // A failing system does not stop the ones after it; the first error is
    // rethrown once the destruction queue is flushed
    std::exception_ptr firstError;
    for (ISystem* system : m_systems) {
        try {
            system->update(deltaTime);
        } catch (const std::exception& e) {
            WORLD_WARN(std::format("{} failed: {}", system->getName(), e.what()));
            if (!firstError) {
                firstError = std::current_exception();
            }
        }
    }
    m_registry.processDestructionQueue();

    if (firstError) {
        std::rethrow_exception(firstError);
    }
    ++m_tickCount;
}

void World::changeMap(std::shared_ptr<const TileMap> map) {
    m_currentMap = map;
    const GameEvent event{MapChangeEvent{std::move(map)}};

    size_t consumed = 0;
    try {
        consumed = m_dispatcher.dispatch(event);
    } catch (...) {
        m_registry.processDestructionQueue();
        throw;
    }
    // Entities of the previous map go before the next frame is drawn
    m_registry.processDestructionQueue();

    WORLD_INFO(std::format("Map '{}' active, {} listeners consumed the change",
                           m_currentMap ? m_currentMap->name : "<none>", consumed));
}

} // namespace TesselEngine
