/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef MOCK_TILE_LAYER_RENDERER_HPP
#define MOCK_TILE_LAYER_RENDERER_HPP

#include "render/ITileLayerRenderer.hpp"
#include <string>
#include <vector>

/**
 * @brief Logs "tile:<layer name>" for every rendered layer
 */
class MockTileLayerRenderer : public TesselEngine::ITileLayerRenderer {
public:
    explicit MockTileLayerRenderer(std::vector<std::string>* callLog = nullptr)
        : mp_callLog(callLog) {}

    void renderTileLayer(const TesselEngine::TileLayer& layer,
                         const TesselEngine::TileMap&) override {
        renderedLayers.push_back(layer.name);
        if (mp_callLog != nullptr) {
            mp_callLog->push_back("tile:" + layer.name);
        }
    }

    std::vector<std::string> renderedLayers;

private:
    std::vector<std::string>* mp_callLog;
};

#endif // MOCK_TILE_LAYER_RENDERER_HPP
