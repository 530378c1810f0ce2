/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IPRESENTATION_SURFACE_HPP
#define IPRESENTATION_SURFACE_HPP

#include "render/Drawable.hpp"
#include <cstddef>
#include <memory>

namespace TesselEngine {

/**
 * @brief Retained-mode stage holding the drawables of the live entities
 *
 * Drawables are drawn in stage order, the last one brought to the front on top.
 */
class IPresentationSurface {
public:
    virtual ~IPresentationSurface() = default;

    virtual void addDrawable(std::shared_ptr<Drawable> drawable) = 0;
    virtual void removeDrawable(const std::shared_ptr<Drawable>& drawable) = 0;

    // Moves the drawable to the top of the stage order
    virtual void toFront(const std::shared_ptr<Drawable>& drawable) = 0;

    virtual void applyViewport() = 0;
    virtual void act(float deltaTime) = 0;
    virtual void draw() = 0;

    virtual size_t getDrawableCount() const = 0;
};

} // namespace TesselEngine

#endif // IPRESENTATION_SURFACE_HPP
