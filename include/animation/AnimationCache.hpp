/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ANIMATION_CACHE_HPP
#define ANIMATION_CACHE_HPP

#include "animation/AnimationClip.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>

namespace TesselEngine {

class IAssetCatalog;

/**
 * @brief Builds animation clips from atlas regions on first use and keeps them
 *
 * Entries live as long as the cache; clips survive map changes.
 */
class AnimationCache {
public:
    AnimationCache(const IAssetCatalog& catalog, float frameDuration);

    /**
     * @brief Returns the clip named clipId, building it from the catalog on a miss
     * @throws AssetError when the catalog has no region named clipId
     */
    std::shared_ptr<const AnimationClip> getOrBuildClip(const std::string& clipId);

    bool contains(const std::string& clipId) const { return m_clips.count(clipId) != 0; }
    size_t size() const { return m_clips.size(); }

private:
    const IAssetCatalog& m_catalog;
    float m_frameDuration;
    std::unordered_map<std::string, std::shared_ptr<const AnimationClip>> m_clips;
};

} // namespace TesselEngine

#endif // ANIMATION_CACHE_HPP
