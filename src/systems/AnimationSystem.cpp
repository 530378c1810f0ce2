/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "systems/AnimationSystem.hpp"
#include "animation/AnimationCache.hpp"
#include "core/EngineErrors.hpp"
#include "core/Logger.hpp"
#include "entities/EntityRegistry.hpp"
#include <exception>
#include <format>
#include <string>

namespace TesselEngine {

AnimationSystem::AnimationSystem(EntityRegistry& registry, AnimationCache& cache)
    : m_registry(registry), m_cache(cache) {}

void AnimationSystem::update(float deltaTime) {
    std::exception_ptr firstError;
    for (const EntityHandle& handle : m_registry.getAnimated()) {
        AnimationState* animation = m_registry.getAnimation(handle);
        RenderableImage* image = m_registry.getRenderable(handle);
        if (animation == nullptr || image == nullptr) {
            continue;
        }
        try {
            tickEntity(*animation, *image, deltaTime);
        } catch (const AssetError& e) {
            ANIMATION_ERROR(std::format("{}: {}", handle.toString(), e.what()));
            if (!firstError) {
                firstError = std::current_exception();
            }
        }
    }

    if (firstError) {
        std::rethrow_exception(firstError);
    }
}

void AnimationSystem::tickEntity(AnimationState& animation, RenderableImage& image, float deltaTime) {
    if (animation.isSwitching()) {
        // The request is dropped even when the clip cannot be built;
        // the entity keeps playing its current clip
        const std::string clipId = animation.nextClipId;
        animation.clearAnimation();
        auto clip = m_cache.getOrBuildClip(clipId);
        animation.clip = clip.get();
        animation.currentClipId = clipId;
        animation.stateTime = 0.0f;
        image.drawable->frame = &clip->getKeyFrame(0.0f, animation.playMode);
        return;
    }

    if (animation.clip == nullptr) {
        return;
    }

    animation.stateTime += deltaTime;
    image.drawable->frame = &animation.clip->getKeyFrame(animation.stateTime, animation.playMode);
}

bool AnimationSystem::handle(const GameEvent& event) {
    if (std::holds_alternative<MapChangeEvent>(event)) {
        ANIMATION_DEBUG(std::format("Map changed, {} clips cached", m_cache.size()));
    }
    return false;
}

} // namespace TesselEngine
