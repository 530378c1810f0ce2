/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TEXTURE_MANAGER_HPP
#define TEXTURE_MANAGER_HPP

#include "utils/Color.hpp"
#include <SDL3/SDL.h>
#include <memory>
#include <string>
#include <unordered_map>

namespace TesselEngine {

/**
 * @brief Holds texture data with cached dimensions to avoid per-frame SDL_GetTextureSize() calls
 */
struct TextureData {
    std::shared_ptr<SDL_Texture> texture;
    float width{0.0f};
    float height{0.0f};
};

/**
 * @brief Owns the SDL textures of the atlas and the tilesets, keyed by id
 */
class TextureManager {
 public:
  TextureManager() = default;
  ~TextureManager() {
    if (!m_isShutdown) {
      clean();
    }
  }

  TextureManager(const TextureManager&) = delete;
  TextureManager& operator=(const TextureManager&) = delete;

  /**
   * @brief Loads an image file as a texture with nearest-pixel sampling
   * @param fileName Path to the image (any format SDL3_image reads)
   * @param textureID Unique identifier for the texture, replaces an existing one
   * @param p_renderer SDL renderer for texture creation
   * @return true if the texture was created, false otherwise
   */
  bool load(const std::string& fileName,
            const std::string& textureID,
            SDL_Renderer* p_renderer);

  /**
   * @brief Draws a sub-rectangle of a texture, modulated by tint
   * @param srcRect Source rectangle in texture pixels
   * @param destRect Destination rectangle in screen pixels
   */
  void drawRegion(const std::string& textureID,
                  const SDL_FRect& srcRect,
                  const SDL_FRect& destRect,
                  SDL_Renderer* p_renderer,
                  const Color& tint = Color::white(),
                  SDL_FlipMode flip = SDL_FLIP_NONE);

  void clearFromTexMap(const std::string& textureID);
  bool isTextureInMap(const std::string& textureID) const;
  const TextureData* getTextureData(const std::string& textureID) const;
  size_t getTextureCount() const { return m_textureMap.size(); }

  /**
   * @brief Cleans up all texture resources and marks manager as shut down
   */
  void clean();
  bool isShutdown() const { return m_isShutdown; }

 private:
  std::unordered_map<std::string, TextureData> m_textureMap{};
  bool m_isShutdown{false};
};

} // namespace TesselEngine

#endif  // TEXTURE_MANAGER_HPP
