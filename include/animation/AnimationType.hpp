/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ANIMATION_TYPE_HPP
#define ANIMATION_TYPE_HPP

#include <cstdint>
#include <ostream>

namespace TesselEngine {

enum class AnimationType : uint8_t {
    IDLE,
    RUN,
    ATTACK,
    DEATH,
    OPEN
};

/**
 * @brief Atlas suffix of an animation type, appended to the entity's atlas key
 */
constexpr const char* animationSuffix(AnimationType type) noexcept {
    switch (type) {
        case AnimationType::IDLE:   return "idle";
        case AnimationType::RUN:    return "run";
        case AnimationType::ATTACK: return "attack";
        case AnimationType::DEATH:  return "death";
        case AnimationType::OPEN:   return "open";
        default:                    return "idle";
    }
}

inline std::ostream& operator<<(std::ostream& os, AnimationType type) {
    return os << animationSuffix(type);
}

} // namespace TesselEngine

#endif // ANIMATION_TYPE_HPP
