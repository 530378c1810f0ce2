/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "render/SDLTileLayerRenderer.hpp"
#include "managers/TextureManager.hpp"
#include "render/SDLStage.hpp"
#include <SDL3/SDL.h>

namespace TesselEngine {

SDLTileLayerRenderer::SDLTileLayerRenderer(const SDLStage& stage, TextureManager& textureManager,
                                           float unitScale)
    : m_stage(stage), m_textureManager(textureManager), m_unitScale(unitScale) {}

std::string SDLTileLayerRenderer::textureIdFor(const Tileset& tileset) {
    return "tileset:" + tileset.imagePath;
}

void SDLTileLayerRenderer::renderTileLayer(const TileLayer& layer, const TileMap& map) {
    if (!layer.visible || layer.opacity <= 0.0f) {
        return;
    }

    SDL_Renderer* renderer = m_stage.getRenderer();
    const float pixelsPerUnit = m_stage.getPixelsPerUnit();
    const float tileWorldWidth = static_cast<float>(map.tileWidth) * m_unitScale;
    const float tileWorldHeight = static_cast<float>(map.tileHeight) * m_unitScale;
    const Color tint{1.0f, 1.0f, 1.0f, layer.opacity};

    const Tileset* currentTileset = nullptr;
    std::string textureId;

    for (int row = 0; row < layer.height; ++row) {
        for (int column = 0; column < layer.width; ++column) {
            const uint32_t rawGid = layer.getGid(column, row);
            const Tileset* tileset = map.findTileset(rawGid);
            if (tileset == nullptr || tileset->columns <= 0) {
                continue;
            }
            if (tileset != currentTileset) {
                currentTileset = tileset;
                textureId = textureIdFor(*tileset);
            }

            const uint32_t localId = (rawGid & TILE_GID_MASK) - tileset->firstGid;
            const int tileColumn = static_cast<int>(localId) % tileset->columns;
            const int tileRow = static_cast<int>(localId) / tileset->columns;
            const SDL_FRect srcRect{
                static_cast<float>(tileset->margin + tileColumn * (tileset->tileWidth + tileset->spacing)),
                static_cast<float>(tileset->margin + tileRow * (tileset->tileHeight + tileset->spacing)),
                static_cast<float>(tileset->tileWidth),
                static_cast<float>(tileset->tileHeight)};

            // Oversized tiles are anchored at the bottom-left of their cell, as Tiled draws them
            const float tileWidth = static_cast<float>(tileset->tileWidth) * m_unitScale;
            const float tileHeight = static_cast<float>(tileset->tileHeight) * m_unitScale;
            const Vector2D topLeft = m_stage.worldToScreen(
                Vector2D(static_cast<float>(column) * tileWorldWidth,
                         static_cast<float>(row + 1) * tileWorldHeight - tileHeight));
            const SDL_FRect destRect{topLeft.getX(), topLeft.getY(),
                                     tileWidth * pixelsPerUnit, tileHeight * pixelsPerUnit};

            int flip = SDL_FLIP_NONE;
            if (rawGid & TILE_FLIP_HORIZONTAL) {
                flip |= SDL_FLIP_HORIZONTAL;
            }
            if (rawGid & TILE_FLIP_VERTICAL) {
                flip |= SDL_FLIP_VERTICAL;
            }

            m_textureManager.drawRegion(textureId, srcRect, destRect, renderer, tint,
                                        static_cast<SDL_FlipMode>(flip));
        }
    }
}

} // namespace TesselEngine
