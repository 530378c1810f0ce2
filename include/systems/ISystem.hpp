/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ISYSTEM_HPP
#define ISYSTEM_HPP

/**
 * @file ISystem.hpp
 * @brief Interface for systems that run once per World tick
 *
 * Event-only systems (like SpawnResolver) do NOT implement this; they react
 * purely to events delivered by the EventDispatcher.
 */

namespace TesselEngine {

class ISystem {
public:
    virtual ~ISystem() = default;

    /**
     * @brief Per-tick update
     * @param deltaTime Time elapsed since the last tick in seconds
     */
    virtual void update(float deltaTime) = 0;

    virtual const char* getName() const = 0;
};

} // namespace TesselEngine

#endif // ISYSTEM_HPP
