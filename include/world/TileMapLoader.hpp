/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TILE_MAP_LOADER_HPP
#define TILE_MAP_LOADER_HPP

#include "world/TileMap.hpp"
#include <memory>
#include <string>

namespace TesselEngine {

class JsonValue;

/**
 * @brief Reads Tiled JSON maps (.tmj) into TileMap
 *
 * Supports tile layers with CSV data (JSON array or comma separated string),
 * object groups, embedded and external (.tsj) tilesets. Group layers are
 * flattened in declaration order. Base64 or compressed layer data is rejected.
 */
class TileMapLoader {
public:
    TileMapLoader() = default;

    /**
     * @brief Loads a map file; tileset image paths are resolved against its directory
     * @return The loaded map, or nullptr with getLastError() set
     */
    std::shared_ptr<TileMap> loadFromFile(const std::string& path);

    /**
     * @brief Parses map JSON held in memory
     * @param baseDirectory Directory used to resolve external tilesets and images
     */
    std::shared_ptr<TileMap> loadFromString(const std::string& json,
                                            const std::string& baseDirectory = "");

    const std::string& getLastError() const { return m_lastError; }

private:
    bool readMap(const JsonValue& root, TileMap& map);
    bool readLayers(const JsonValue& layers, TileMap& map);
    bool readTileLayer(const JsonValue& layer, TileMap& map);
    void readObjectLayer(const JsonValue& layer, TileMap& map);
    bool readTileset(const JsonValue& entry, TileMap& map);
    bool fail(const std::string& message);

    std::string m_baseDirectory;
    std::string m_lastError;
};

} // namespace TesselEngine

#endif // TILE_MAP_LOADER_HPP
