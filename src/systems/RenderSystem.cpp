/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "systems/RenderSystem.hpp"
#include "core/EngineConfig.hpp"
#include "core/Logger.hpp"
#include "entities/EntityRegistry.hpp"
#include "render/IPresentationSurface.hpp"
#include "render/ITileLayerRenderer.hpp"
#include <algorithm>
#include <format>

namespace TesselEngine {

RenderSystem::RenderSystem(EntityRegistry& registry, IPresentationSurface& surface,
                           ITileLayerRenderer& tileRenderer, const EngineConfig& config)
    : m_registry(registry), m_surface(surface), m_tileRenderer(tileRenderer), m_config(config) {}

void RenderSystem::update(float deltaTime) {
    sortRenderables();
    for (const SortEntry& entry : m_sortBuffer) {
        m_surface.toFront(entry.image->drawable);
    }

    m_surface.applyViewport();
    renderLayers(m_backgroundLayers);
    m_surface.act(deltaTime);
    m_surface.draw();
    renderLayers(m_foregroundLayers);
}

void RenderSystem::sortRenderables() {
    m_sortBuffer.clear();
    for (const EntityHandle& handle : m_registry.getRenderables()) {
        const RenderableImage* image = m_registry.getRenderable(handle);
        if (image != nullptr && image->drawable) {
            m_sortBuffer.push_back({handle, image});
        }
    }

    // Stable: equal keys keep creation order
    std::stable_sort(m_sortBuffer.begin(), m_sortBuffer.end(),
                     [](const SortEntry& a, const SortEntry& b) {
                         if (a.image->layer != b.image->layer) {
                             return a.image->layer < b.image->layer;
                         }
                         return a.image->drawable->position.getX() > b.image->drawable->position.getX();
                     });

    m_drawOrder.clear();
    for (const SortEntry& entry : m_sortBuffer) {
        m_drawOrder.push_back(entry.handle);
    }
}

void RenderSystem::renderLayers(const LayerList& layers) {
    if (!m_map) {
        return;
    }
    for (const TileLayer* layer : layers) {
        m_tileRenderer.renderTileLayer(*layer, *m_map);
    }
}

bool RenderSystem::handle(const GameEvent& event) {
    const MapChangeEvent* mapChange = std::get_if<MapChangeEvent>(&event);
    if (mapChange == nullptr) {
        return false;
    }

    m_backgroundLayers.clear();
    m_foregroundLayers.clear();
    m_map = mapChange->map;
    if (!m_map) {
        return true;
    }

    for (const TileLayer& layer : m_map->tileLayers) {
        if (layer.name.starts_with(m_config.foregroundLayerPrefix)) {
            m_foregroundLayers.push_back(&layer);
        } else {
            m_backgroundLayers.push_back(&layer);
        }
    }

    RENDER_DEBUG(std::format("Map layers: {} background, {} foreground",
                             m_backgroundLayers.size(), m_foregroundLayers.size()));
    return true;
}

} // namespace TesselEngine
