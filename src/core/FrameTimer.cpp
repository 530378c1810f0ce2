/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/FrameTimer.hpp"
#include <SDL3/SDL.h>
#include <algorithm>

namespace TesselEngine {

FrameTimer::FrameTimer(float targetFPS)
    : m_targetFrameTime(targetFPS > 0.0f ? 1.0f / targetFPS : 1.0f / 60.0f) {}

float FrameTimer::startFrame() {
    const auto now = Clock::now();
    ++m_frameCount;

    if (m_firstFrame) {
        m_firstFrame = false;
        m_frameStart = now;
        return 0.0f;
    }

    const float delta = std::chrono::duration<float>(now - m_frameStart).count();
    m_frameStart = now;

    if (delta > 0.0f) {
        const float instantFPS = 1.0f / delta;
        m_currentFPS = m_currentFPS == 0.0f
                           ? instantFPS
                           : m_smoothingAlpha * instantFPS + (1.0f - m_smoothingAlpha) * m_currentFPS;
    }
    return std::min(delta, MAX_DELTA);
}

void FrameTimer::endFrame() const {
    // VSync paces the loop through SDL_RenderPresent()
    if (!m_softwareFrameLimiting) {
        return;
    }

    const auto targetEnd = m_frameStart + std::chrono::duration_cast<Clock::duration>(
                                              std::chrono::duration<float>(m_targetFrameTime));
    const auto remaining = std::chrono::duration_cast<std::chrono::nanoseconds>(targetEnd - Clock::now());
    if (remaining.count() > 0) {
        SDL_DelayPrecise(static_cast<Uint64>(remaining.count()));
    }
}

} // namespace TesselEngine
