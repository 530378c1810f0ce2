/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "systems/EntitySpawnSystem.hpp"
#include "animation/AnimationType.hpp"
#include "assets/IAssetCatalog.hpp"
#include "core/EngineConfig.hpp"
#include "core/EngineErrors.hpp"
#include "core/Logger.hpp"
#include "entities/EntityRegistry.hpp"
#include <algorithm>
#include <cctype>
#include <exception>
#include <format>
#include <memory>

namespace TesselEngine {

namespace {

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // anonymous namespace

EntitySpawnSystem::EntitySpawnSystem(EntityRegistry& registry, const IAssetCatalog& catalog,
                                     const EngineConfig& config)
    : m_registry(registry), m_catalog(catalog), m_config(config) {}

void EntitySpawnSystem::update(float) {
    if (m_registry.getSpawnRequests().empty()) {
        return;
    }

    // materialize() grows the registry, iterate over a snapshot
    const std::vector<EntityHandle> requests = m_registry.getSpawnRequests();
    std::exception_ptr firstError;
    for (const EntityHandle& handle : requests) {
        if (m_registry.isPendingDestruction(handle)) {
            continue;
        }
        const SpawnRequest* pending = m_registry.getSpawnRequest(handle);
        if (pending == nullptr) {
            continue;
        }

        const SpawnRequest request = *pending;
        m_registry.destroyEntity(handle);
        try {
            materialize(request);
        } catch (const EngineError& e) {
            SPAWN_ERROR(std::format("Cannot spawn '{}': {}", request.entityType, e.what()));
            if (!firstError) {
                firstError = std::current_exception();
            }
        }
    }

    if (firstError) {
        std::rethrow_exception(firstError);
    }
}

bool EntitySpawnSystem::handle(const GameEvent& event) {
    if (!std::holds_alternative<MapChangeEvent>(event)) {
        return false;
    }

    size_t purged = 0;
    for (const EntityHandle& handle : m_spawned) {
        if (m_registry.isValidHandle(handle)) {
            m_registry.destroyEntity(handle);
            ++purged;
        }
    }
    m_spawned.clear();

    for (const EntityHandle& handle : m_registry.getSpawnRequests()) {
        m_registry.destroyEntity(handle);
        ++purged;
    }

    if (purged > 0) {
        SPAWN_INFO(std::format("Map changed, removing {} entities of the previous map", purged));
    }
    return false;
}

SpawnConfig EntitySpawnSystem::spawnConfig(const std::string& entityType) {
    auto it = m_configCache.find(entityType);
    if (it != m_configCache.end()) {
        return it->second;
    }

    SpawnConfig config;
    auto alias = m_config.spawnAliases.find(entityType);
    if (alias != m_config.spawnAliases.end()) {
        config.atlasKey = alias->second;
    } else if (!isBlank(entityType)) {
        config.atlasKey = toLower(entityType);
    } else {
        throw ConfigError("spawn type must be specified");
    }

    SPAWN_DEBUG(std::format("Spawn config for '{}' uses atlas key '{}'", entityType, config.atlasKey));
    m_configCache.emplace(entityType, config);
    return config;
}

Vector2D EntitySpawnSystem::referenceSize(const std::string& atlasKey) {
    auto it = m_sizeCache.find(atlasKey);
    if (it != m_sizeCache.end()) {
        return it->second;
    }

    const std::vector<AtlasRegion> regions =
        m_catalog.findRegions(atlasKey + "/" + animationSuffix(AnimationType::IDLE));
    if (regions.empty()) {
        throw AssetError(std::format("no regions for atlas key {}", atlasKey));
    }

    const AtlasRegion& firstFrame = regions.front();
    Vector2D size(static_cast<float>(firstFrame.originalWidth) * m_config.unitScale,
                  static_cast<float>(firstFrame.originalHeight) * m_config.unitScale);
    m_sizeCache.emplace(atlasKey, size);
    return size;
}

EntityHandle EntitySpawnSystem::materialize(const SpawnRequest& request) {
    const SpawnConfig config = spawnConfig(request.entityType);
    const Vector2D size = referenceSize(config.atlasKey);

    auto drawable = std::make_shared<Drawable>();
    drawable->position = request.location;
    drawable->size = size;
    drawable->tint = request.tint;

    AnimationState animation;
    animation.nextAnimation(config.atlasKey, AnimationType::IDLE);

    RenderableImage image{m_config.defaultRenderLayer, std::move(drawable)};
    EntityHandle handle = m_registry.createAnimatedImage(std::move(image), std::move(animation));
    m_spawned.push_back(handle);

    SPAWN_DEBUG(std::format("Spawned '{}' at ({}, {}) as {}", request.entityType,
                            request.location.getX(), request.location.getY(), handle.toString()));
    return handle;
}

} // namespace TesselEngine
