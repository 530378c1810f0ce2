/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ANIMATION_STATE_HPP
#define ANIMATION_STATE_HPP

#include "animation/AnimationClip.hpp"
#include "animation/AnimationType.hpp"
#include <string>

namespace TesselEngine {

/**
 * @brief Per-entity playback state driven by AnimationSystem
 *
 * While nextClipId is set the entity is switching: the next tick resolves the
 * clip, resets stateTime and shows frame 0. Otherwise it is playing and
 * stateTime advances by the tick's delta.
 */
struct AnimationState {
    static inline const std::string NO_ANIMATION{};

    std::string atlasKey;
    float stateTime{0.0f};
    PlayMode playMode{PlayMode::LOOP};
    std::string currentClipId;
    std::string nextClipId;
    // Owned by AnimationCache, null until the first switch
    const AnimationClip* clip{nullptr};

    // Requests "<atlasKey>/<type>" using the current atlas key
    void nextAnimation(AnimationType type);
    void nextAnimation(const std::string& key, AnimationType type);
    void clearAnimation() { nextClipId = NO_ANIMATION; }

    bool isSwitching() const { return nextClipId != NO_ANIMATION; }
    bool isAnimationFinished() const;
};

} // namespace TesselEngine

#endif // ANIMATION_STATE_HPP
