/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "systems/SpawnResolver.hpp"
#include "core/EngineConfig.hpp"
#include "core/EngineErrors.hpp"
#include "core/Logger.hpp"
#include "entities/EntityRegistry.hpp"
#include <format>
#include <vector>

namespace TesselEngine {

SpawnResolver::SpawnResolver(EntityRegistry& registry, const EngineConfig& config)
    : m_registry(registry), m_config(config) {}

bool SpawnResolver::handle(const GameEvent& event) {
    const MapChangeEvent* mapChange = std::get_if<MapChangeEvent>(&event);
    if (mapChange == nullptr || !mapChange->map) {
        return false;
    }

    const ObjectLayer* layer = mapChange->map->findObjectLayer(m_config.entitiesLayerName);
    if (layer == nullptr) {
        throw ConfigError(std::format("Map '{}' has no '{}' object layer",
                                      mapChange->map->name, m_config.entitiesLayerName));
    }

    // Resolve every object before creating any request
    std::vector<SpawnRequest> requests;
    requests.reserve(layer->objects.size());
    for (const MapObject& object : layer->objects) {
        requests.push_back(resolve(object));
    }

    for (SpawnRequest& request : requests) {
        m_registry.createSpawnRequest(std::move(request));
    }

    SPAWN_INFO(std::format("Queued {} spawn requests from layer '{}'",
                           requests.size(), layer->name));
    return true;
}

SpawnRequest SpawnResolver::resolve(const MapObject& object) const {
    if (!object.type) {
        throw ConfigError(std::format("MapObject {} of '{}' layer does not have a type",
                                      object.id, m_config.entitiesLayerName));
    }

    SpawnRequest request;
    request.entityType = *object.type;
    request.location = Vector2D(object.x, object.y) * m_config.unitScale;

    if (const std::string* color = object.findProperty("color")) {
        if (auto tint = Color::fromTiledString(*color)) {
            request.tint = *tint;
        } else {
            SPAWN_WARN(std::format("MapObject {} has malformed color '{}', using white",
                                   object.id, *color));
        }
    }
    return request;
}

} // namespace TesselEngine
