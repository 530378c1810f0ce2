/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FRAME_TIMER_HPP
#define FRAME_TIMER_HPP

#include <chrono>
#include <cstdint>

namespace TesselEngine {

/**
 * @brief Measures the variable frame delta fed to World::update
 *
 * The World runs exactly one tick per rendered frame, so there is no
 * accumulator: the delta is the time since the previous frame, clamped to
 * MAX_DELTA to keep a stalled frame (window drag, breakpoint) from skipping
 * whole animation cycles. Without VSync the timer sleeps to the target rate.
 */
class FrameTimer {
public:
    explicit FrameTimer(float targetFPS = 60.0f);

    // Returns the delta in seconds since the previous startFrame(), 0 on the first frame
    float startFrame();
    void endFrame() const;

    void setSoftwareFrameLimiting(bool enabled) { m_softwareFrameLimiting = enabled; }
    bool isUsingSoftwareFrameLimiting() const { return m_softwareFrameLimiting; }
    float getCurrentFPS() const { return m_currentFPS; }
    uint64_t getFrameCount() const { return m_frameCount; }

    static constexpr float MAX_DELTA = 0.25f;

private:
    using Clock = std::chrono::steady_clock;

    float m_targetFrameTime;
    Clock::time_point m_frameStart{};
    bool m_firstFrame{true};
    bool m_softwareFrameLimiting{false};
    float m_currentFPS{0.0f};
    float m_smoothingAlpha{0.05f};
    uint64_t m_frameCount{0};
};

} // namespace TesselEngine

#endif // FRAME_TIMER_HPP
