/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IASSET_CATALOG_HPP
#define IASSET_CATALOG_HPP

#include <string>
#include <vector>

namespace TesselEngine {

/**
 * @brief One named sub-rectangle of an atlas texture
 *
 * Regions sharing a name form an animation strip ordered by index.
 * originalWidth/originalHeight are the untrimmed pixel dimensions of the frame.
 */
struct AtlasRegion {
    std::string name;
    int index{0};
    int x{0};
    int y{0};
    int width{0};
    int height{0};
    int originalWidth{0};
    int originalHeight{0};
    std::string textureId;
};

/**
 * @brief Read-only lookup of atlas regions by name
 */
class IAssetCatalog {
public:
    virtual ~IAssetCatalog() = default;

    /**
     * @brief Returns every region named key, ordered by region index
     * @return Empty vector when no region matches, never throws for a missing key
     */
    virtual std::vector<AtlasRegion> findRegions(const std::string& key) const = 0;
};

} // namespace TesselEngine

#endif // IASSET_CATALOG_HPP
