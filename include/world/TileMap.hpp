/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TILE_MAP_HPP
#define TILE_MAP_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace TesselEngine {

// Tiled stores flip flags in the top bits of every gid
constexpr uint32_t TILE_FLIP_HORIZONTAL = 0x80000000u;
constexpr uint32_t TILE_FLIP_VERTICAL = 0x40000000u;
constexpr uint32_t TILE_FLIP_DIAGONAL = 0x20000000u;
constexpr uint32_t TILE_GID_MASK = 0x1FFFFFFFu;

struct Tileset {
    uint32_t firstGid{1};
    std::string name;
    std::string imagePath;
    int tileWidth{0};
    int tileHeight{0};
    int columns{0};
    int tileCount{0};
    int margin{0};
    int spacing{0};
};

/**
 * @brief Grid of global tile ids, row-major, 0 meaning empty
 */
struct TileLayer {
    std::string name;
    int width{0};
    int height{0};
    bool visible{true};
    float opacity{1.0f};
    std::vector<uint32_t> gids;

    uint32_t getGid(int column, int row) const {
        if (column < 0 || row < 0 || column >= width || row >= height) {
            return 0;
        }
        return gids[static_cast<size_t>(row) * width + column];
    }
};

/**
 * @brief One object of an object layer, coordinates in map pixels
 *
 * Custom properties are kept as their textual form regardless of Tiled type
 * (colors stay "#AARRGGBB", numbers and booleans are stringified).
 */
struct MapObject {
    int id{0};
    std::optional<std::string> type;
    std::string name;
    float x{0.0f};
    float y{0.0f};
    float width{0.0f};
    float height{0.0f};
    std::unordered_map<std::string, std::string> properties;

    const std::string* findProperty(const std::string& key) const {
        auto it = properties.find(key);
        return it == properties.end() ? nullptr : &it->second;
    }
};

struct ObjectLayer {
    std::string name;
    std::vector<MapObject> objects;
};

/**
 * @brief Immutable map data shared by the systems through MapChangeEvent
 *
 * tileLayers and objectLayers keep the declaration order of the source file.
 */
struct TileMap {
    std::string name;
    int width{0};
    int height{0};
    int tileWidth{0};
    int tileHeight{0};
    std::vector<Tileset> tilesets;
    std::vector<TileLayer> tileLayers;
    std::vector<ObjectLayer> objectLayers;

    const ObjectLayer* findObjectLayer(const std::string& layerName) const;

    /**
     * @brief Returns the tileset owning gid (flip bits ignored), nullptr for empty or unknown gids
     */
    const Tileset* findTileset(uint32_t gid) const;
};

} // namespace TesselEngine

#endif // TILE_MAP_HPP
