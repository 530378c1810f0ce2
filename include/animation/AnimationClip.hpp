/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ANIMATION_CLIP_HPP
#define ANIMATION_CLIP_HPP

#include "assets/IAssetCatalog.hpp"
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace TesselEngine {

enum class PlayMode : uint8_t {
    NORMAL,        // Plays once, holds the last frame
    REVERSED,      // Plays once from the end, holds the first frame
    LOOP,
    LOOP_REVERSED
};

inline std::ostream& operator<<(std::ostream& os, PlayMode mode) {
    switch (mode) {
        case PlayMode::NORMAL:        return os << "NORMAL";
        case PlayMode::REVERSED:      return os << "REVERSED";
        case PlayMode::LOOP:          return os << "LOOP";
        case PlayMode::LOOP_REVERSED: return os << "LOOP_REVERSED";
    }
    return os << "UNKNOWN";
}

/**
 * @brief Immutable frame sequence with a fixed per-frame duration
 *
 * Clips carry no playback state and are shared between every entity playing
 * them; the elapsed time lives in each entity's AnimationState.
 */
class AnimationClip {
public:
    /**
     * @throws std::invalid_argument if frames is empty or frameDuration is not positive
     */
    AnimationClip(std::string id, std::vector<AtlasRegion> frames, float frameDuration);

    const std::string& getId() const { return m_id; }
    const std::vector<AtlasRegion>& getFrames() const { return m_frames; }
    size_t getFrameCount() const { return m_frames.size(); }
    float getFrameDuration() const { return m_frameDuration; }
    float getDuration() const { return m_frameDuration * static_cast<float>(m_frames.size()); }

    /**
     * @brief Index of the frame shown stateTime seconds into playback
     */
    size_t getKeyFrameIndex(float stateTime, PlayMode mode) const;
    const AtlasRegion& getKeyFrame(float stateTime, PlayMode mode) const;

    /**
     * @brief True once a NORMAL or REVERSED clip has played through; never for loop modes
     */
    bool isFinished(float stateTime, PlayMode mode) const;

private:
    std::string m_id;
    std::vector<AtlasRegion> m_frames;
    float m_frameDuration;
};

} // namespace TesselEngine

#endif // ANIMATION_CLIP_HPP
