/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "animation/AnimationCache.hpp"
#include "assets/IAssetCatalog.hpp"
#include "core/EngineErrors.hpp"
#include "core/Logger.hpp"
#include <format>

namespace TesselEngine {

AnimationCache::AnimationCache(const IAssetCatalog& catalog, float frameDuration)
    : m_catalog(catalog), m_frameDuration(frameDuration) {}

std::shared_ptr<const AnimationClip> AnimationCache::getOrBuildClip(const std::string& clipId) {
    auto it = m_clips.find(clipId);
    if (it != m_clips.end()) {
        return it->second;
    }

    ANIMATION_DEBUG(std::format("Creating animation for {}", clipId));
    std::vector<AtlasRegion> regions = m_catalog.findRegions(clipId);
    if (regions.empty()) {
        throw AssetError(std::format("no regions for atlas key {}", clipId));
    }

    auto clip = std::make_shared<const AnimationClip>(clipId, std::move(regions), m_frameDuration);
    m_clips.emplace(clipId, clip);
    return clip;
}

} // namespace TesselEngine
