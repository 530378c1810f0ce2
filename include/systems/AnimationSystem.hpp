/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ANIMATION_SYSTEM_HPP
#define ANIMATION_SYSTEM_HPP

#include "events/GameEvent.hpp"
#include "systems/ISystem.hpp"

namespace TesselEngine {

class AnimationCache;
class EntityRegistry;
struct AnimationState;
struct RenderableImage;

/**
 * @brief Advances per-entity playback and presents the current frame
 *
 * Processes every entity with both AnimationState and RenderableImage.
 * A pending clip request switches the entity (clip resolved through the
 * cache, stateTime reset, frame 0 shown); otherwise stateTime advances and
 * the frame at stateTime under the entity's play mode is shown.
 */
class AnimationSystem : public ISystem, public IEventListener {
public:
    AnimationSystem(EntityRegistry& registry, AnimationCache& cache);

    /**
     * Every entity is ticked even when one clip fails to build.
     * @throws AssetError, the first one of the tick, when a requested clip has
     *         no regions; that request is dropped and the entity keeps its
     *         current clip
     */
    void update(float deltaTime) override;
    const char* getName() const override { return "AnimationSystem"; }

    // Clips outlive maps: logs the cache size and never consumes
    bool handle(const GameEvent& event) override;

private:
    void tickEntity(AnimationState& animation, RenderableImage& image, float deltaTime);

    EntityRegistry& m_registry;
    AnimationCache& m_cache;
};

} // namespace TesselEngine

#endif // ANIMATION_SYSTEM_HPP
