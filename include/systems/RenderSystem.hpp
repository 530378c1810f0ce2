/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RENDER_SYSTEM_HPP
#define RENDER_SYSTEM_HPP

#include "entities/EntityHandle.hpp"
#include "events/GameEvent.hpp"
#include "systems/ISystem.hpp"
#include <boost/container/small_vector.hpp>
#include <memory>
#include <vector>

namespace TesselEngine {

class EntityRegistry;
class IPresentationSurface;
class ITileLayerRenderer;
struct EngineConfig;
struct RenderableImage;

/**
 * @brief Orders the visual entities and draws one frame
 *
 * Frame sequence: stage order rebuilt from the (layer ascending, x descending)
 * sort, viewport applied, background tile layers, surface act and draw,
 * foreground tile layers. Entities with equal keys keep creation order.
 */
class RenderSystem : public ISystem, public IEventListener {
public:
    using LayerList = boost::container::small_vector<const TileLayer*, 8>;

    RenderSystem(EntityRegistry& registry, IPresentationSurface& surface,
                 ITileLayerRenderer& tileRenderer, const EngineConfig& config);

    void update(float deltaTime) override;
    const char* getName() const override { return "RenderSystem"; }

    /**
     * @brief Splits the new map's tile layers into background and foreground
     * @return true for a MapChangeEvent
     */
    bool handle(const GameEvent& event) override;

    // Handles in the order they were last brought to the front
    const std::vector<EntityHandle>& getDrawOrder() const { return m_drawOrder; }
    const LayerList& getBackgroundLayers() const { return m_backgroundLayers; }
    const LayerList& getForegroundLayers() const { return m_foregroundLayers; }

private:
    struct SortEntry {
        EntityHandle handle;
        const RenderableImage* image;
    };

    void sortRenderables();
    void renderLayers(const LayerList& layers);

    EntityRegistry& m_registry;
    IPresentationSurface& m_surface;
    ITileLayerRenderer& m_tileRenderer;
    const EngineConfig& m_config;

    // Keeps the layers below alive
    std::shared_ptr<const TileMap> m_map;
    LayerList m_backgroundLayers;
    LayerList m_foregroundLayers;

    std::vector<SortEntry> m_sortBuffer;  // Reused every frame
    std::vector<EntityHandle> m_drawOrder;
};

} // namespace TesselEngine

#endif // RENDER_SYSTEM_HPP
