/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TEXTURE_ATLAS_HPP
#define TEXTURE_ATLAS_HPP

#include "assets/IAssetCatalog.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace TesselEngine {

class JsonValue;

/**
 * @brief In-memory atlas index implementing IAssetCatalog
 *
 * Holds region metadata only; pixel data is owned by TextureManager under
 * getTextureId(). Manifest format read by loadFromFile():
 * @code
 * { "image": "game.png",
 *   "regions": [ { "name": "player/idle", "index": 0, "x": 0, "y": 0,
 *                  "width": 32, "height": 32,
 *                  "originalWidth": 32, "originalHeight": 32 } ] }
 * @endcode
 */
class TextureAtlas : public IAssetCatalog {
public:
    explicit TextureAtlas(std::string textureId = "atlas");
    ~TextureAtlas() override = default;

    /**
     * @brief Loads regions from a JSON manifest, replacing current contents
     * @return true on success; getLastError() describes a failure
     */
    bool loadFromFile(const std::string& manifestPath);
    bool loadFromString(const std::string& json);

    /**
     * @brief Adds one region; the region's textureId is set to this atlas' texture
     */
    void addRegion(AtlasRegion region);

    std::vector<AtlasRegion> findRegions(const std::string& key) const override;

    size_t getRegionCount() const { return m_regionCount; }
    const std::string& getTextureId() const { return m_textureId; }
    // Image path from the manifest, relative to the manifest's directory
    const std::string& getImagePath() const { return m_imagePath; }
    const std::string& getLastError() const { return m_lastError; }
    void clear();

private:
    bool applyManifest(const JsonValue& root);

    std::string m_textureId;
    std::string m_imagePath;
    std::string m_lastError;
    // Regions grouped by name, kept sorted by index on insert
    std::unordered_map<std::string, std::vector<AtlasRegion>> m_regions;
    size_t m_regionCount{0};
};

} // namespace TesselEngine

#endif // TEXTURE_ATLAS_HPP
