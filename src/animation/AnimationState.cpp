/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "animation/AnimationState.hpp"

namespace TesselEngine {

void AnimationState::nextAnimation(AnimationType type) {
    nextClipId = atlasKey + "/" + animationSuffix(type);
}

void AnimationState::nextAnimation(const std::string& key, AnimationType type) {
    atlasKey = key;
    nextAnimation(type);
}

bool AnimationState::isAnimationFinished() const {
    return clip != nullptr && clip->isFinished(stateTime, playMode);
}

} // namespace TesselEngine
