/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "animation/AnimationClip.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace TesselEngine {

namespace {

size_t frameNumber(float stateTime, float frameDuration) {
    if (stateTime <= 0.0f) {
        return 0;
    }
    return static_cast<size_t>(stateTime / frameDuration);
}

} // anonymous namespace

AnimationClip::AnimationClip(std::string id, std::vector<AtlasRegion> frames, float frameDuration)
    : m_id(std::move(id)), m_frames(std::move(frames)), m_frameDuration(frameDuration) {
    if (m_frames.empty()) {
        throw std::invalid_argument(std::format("Animation clip '{}' has no frames", m_id));
    }
    if (!(m_frameDuration > 0.0f)) {
        throw std::invalid_argument(
            std::format("Animation clip '{}' needs a positive frame duration, got {}", m_id, m_frameDuration));
    }
}

size_t AnimationClip::getKeyFrameIndex(float stateTime, PlayMode mode) const {
    const size_t count = m_frames.size();
    if (count == 1) {
        return 0;
    }

    const size_t frame = frameNumber(stateTime, m_frameDuration);
    switch (mode) {
        case PlayMode::NORMAL:
            return std::min(count - 1, frame);
        case PlayMode::REVERSED:
            return frame >= count ? 0 : count - frame - 1;
        case PlayMode::LOOP:
            return frame % count;
        case PlayMode::LOOP_REVERSED:
            return count - (frame % count) - 1;
    }
    return 0;
}

const AtlasRegion& AnimationClip::getKeyFrame(float stateTime, PlayMode mode) const {
    return m_frames[getKeyFrameIndex(stateTime, mode)];
}

bool AnimationClip::isFinished(float stateTime, PlayMode mode) const {
    if (mode == PlayMode::LOOP || mode == PlayMode::LOOP_REVERSED) {
        return false;
    }
    return frameNumber(stateTime, m_frameDuration) >= m_frames.size();
}

} // namespace TesselEngine
