/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ITILE_LAYER_RENDERER_HPP
#define ITILE_LAYER_RENDERER_HPP

#include "world/TileMap.hpp"

namespace TesselEngine {

class ITileLayerRenderer {
public:
    virtual ~ITileLayerRenderer() = default;
    virtual void renderTileLayer(const TileLayer& layer, const TileMap& map) = 0;
};

} // namespace TesselEngine

#endif // ITILE_LAYER_RENDERER_HPP
