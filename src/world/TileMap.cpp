/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/TileMap.hpp"

namespace TesselEngine {

const ObjectLayer* TileMap::findObjectLayer(const std::string& layerName) const {
    for (const auto& layer : objectLayers) {
        if (layer.name == layerName) {
            return &layer;
        }
    }
    return nullptr;
}

const Tileset* TileMap::findTileset(uint32_t gid) const {
    gid &= TILE_GID_MASK;
    if (gid == 0) {
        return nullptr;
    }

    // Tilesets are sorted by firstGid; the owner is the last one starting at or before gid
    const Tileset* owner = nullptr;
    for (const auto& tileset : tilesets) {
        if (tileset.firstGid <= gid) {
            owner = &tileset;
        } else {
            break;
        }
    }

    if (owner != nullptr && owner->tileCount > 0 && gid >= owner->firstGid + owner->tileCount) {
        return nullptr;
    }
    return owner;
}

} // namespace TesselEngine
