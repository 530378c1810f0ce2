/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SDL_TILE_LAYER_RENDERER_HPP
#define SDL_TILE_LAYER_RENDERER_HPP

#include "render/ITileLayerRenderer.hpp"
#include <string>

struct SDL_Renderer;

namespace TesselEngine {

class SDLStage;
class TextureManager;

/**
 * @brief Draws tile layers through the stage's world-to-screen transform
 *
 * Tileset images must be loaded in the TextureManager under textureIdFor().
 */
class SDLTileLayerRenderer : public ITileLayerRenderer {
public:
    SDLTileLayerRenderer(const SDLStage& stage, TextureManager& textureManager, float unitScale);

    void renderTileLayer(const TileLayer& layer, const TileMap& map) override;

    static std::string textureIdFor(const Tileset& tileset);

private:
    const SDLStage& m_stage;
    TextureManager& m_textureManager;
    float m_unitScale;
};

} // namespace TesselEngine

#endif // SDL_TILE_LAYER_RENDERER_HPP
