/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SDL_STAGE_HPP
#define SDL_STAGE_HPP

#include "render/IPresentationSurface.hpp"
#include "utils/Vector2D.hpp"
#include <memory>
#include <vector>

struct SDL_Renderer;

namespace TesselEngine {

class TextureManager;

/**
 * @brief IPresentationSurface drawing atlas frames with an SDL renderer
 *
 * Maps a fixed world-unit viewport onto the render output, keeping the aspect
 * ratio (letterboxed). World origin is the top-left corner of the map.
 */
class SDLStage : public IPresentationSurface {
public:
    SDLStage(SDL_Renderer* renderer, TextureManager& textureManager,
             float viewportWidth, float viewportHeight);

    void addDrawable(std::shared_ptr<Drawable> drawable) override;
    void removeDrawable(const std::shared_ptr<Drawable>& drawable) override;
    void toFront(const std::shared_ptr<Drawable>& drawable) override;

    // Recomputes the world-to-screen transform from the current output size
    void applyViewport() override;
    void act(float deltaTime) override;
    void draw() override;

    size_t getDrawableCount() const override { return m_drawables.size(); }

    Vector2D worldToScreen(const Vector2D& world) const;
    float getPixelsPerUnit() const { return m_pixelsPerUnit; }
    SDL_Renderer* getRenderer() const { return mp_renderer; }

private:
    SDL_Renderer* mp_renderer;
    TextureManager& m_textureManager;
    float m_viewportWidth;
    float m_viewportHeight;

    float m_pixelsPerUnit{1.0f};
    float m_offsetX{0.0f};
    float m_offsetY{0.0f};
    float m_elapsed{0.0f};

    // Stage order, back to front
    std::vector<std::shared_ptr<Drawable>> m_drawables;
};

} // namespace TesselEngine

#endif // SDL_STAGE_HPP
