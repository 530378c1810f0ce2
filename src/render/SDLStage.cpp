/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "render/SDLStage.hpp"
#include "core/Logger.hpp"
#include "managers/TextureManager.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <format>

namespace TesselEngine {

SDLStage::SDLStage(SDL_Renderer* renderer, TextureManager& textureManager,
                   float viewportWidth, float viewportHeight)
    : mp_renderer(renderer),
      m_textureManager(textureManager),
      m_viewportWidth(viewportWidth > 0.0f ? viewportWidth : 16.0f),
      m_viewportHeight(viewportHeight > 0.0f ? viewportHeight : 9.0f) {}

void SDLStage::addDrawable(std::shared_ptr<Drawable> drawable) {
    if (!drawable) {
        return;
    }
    m_drawables.push_back(std::move(drawable));
}

void SDLStage::removeDrawable(const std::shared_ptr<Drawable>& drawable) {
    auto it = std::find(m_drawables.begin(), m_drawables.end(), drawable);
    if (it != m_drawables.end()) {
        m_drawables.erase(it);
    }
}

void SDLStage::toFront(const std::shared_ptr<Drawable>& drawable) {
    auto it = std::find(m_drawables.begin(), m_drawables.end(), drawable);
    if (it != m_drawables.end()) {
        std::rotate(it, it + 1, m_drawables.end());
    }
}

void SDLStage::applyViewport() {
    int width = 0;
    int height = 0;
    if (!SDL_GetCurrentRenderOutputSize(mp_renderer, &width, &height) || width <= 0 || height <= 0) {
        RENDER_WARN(std::format("Failed to query render output size: {}", SDL_GetError()));
        return;
    }

    m_pixelsPerUnit = std::min(static_cast<float>(width) / m_viewportWidth,
                               static_cast<float>(height) / m_viewportHeight);
    m_offsetX = (static_cast<float>(width) - m_viewportWidth * m_pixelsPerUnit) * 0.5f;
    m_offsetY = (static_cast<float>(height) - m_viewportHeight * m_pixelsPerUnit) * 0.5f;
}

void SDLStage::act(float deltaTime) {
    m_elapsed += deltaTime;
}

void SDLStage::draw() {
    for (const auto& drawable : m_drawables) {
        if (!drawable->visible || drawable->frame == nullptr) {
            continue;
        }

        const AtlasRegion& frame = *drawable->frame;
        const SDL_FRect srcRect{static_cast<float>(frame.x), static_cast<float>(frame.y),
                                static_cast<float>(frame.width), static_cast<float>(frame.height)};
        const Vector2D topLeft = worldToScreen(drawable->position);
        const SDL_FRect destRect{topLeft.getX(), topLeft.getY(),
                                 drawable->size.getX() * m_pixelsPerUnit,
                                 drawable->size.getY() * m_pixelsPerUnit};

        m_textureManager.drawRegion(frame.textureId, srcRect, destRect, mp_renderer, drawable->tint);
    }
}

Vector2D SDLStage::worldToScreen(const Vector2D& world) const {
    return Vector2D(m_offsetX + world.getX() * m_pixelsPerUnit,
                    m_offsetY + world.getY() * m_pixelsPerUnit);
}

} // namespace TesselEngine
