/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/TextureManager.hpp"
#include "core/Logger.hpp"
#include <SDL3_image/SDL_image.h>
#include <format>

namespace TesselEngine {

bool TextureManager::load(const std::string& fileName,
                          const std::string& textureID,
                          SDL_Renderer* p_renderer) {
  if (p_renderer == nullptr) {
    TEXTURE_ERROR("Cannot load '" + textureID + "' without a renderer");
    return false;
  }

  // Load with immediate RAII
  auto surface = std::unique_ptr<SDL_Surface, decltype(&SDL_DestroySurface)>(
      IMG_Load(fileName.c_str()), SDL_DestroySurface);

  if (!surface) {
    TEXTURE_ERROR(std::format("Could not load image {}: {}", fileName, SDL_GetError()));
    return false;
  }

  auto texture = std::unique_ptr<SDL_Texture, decltype(&SDL_DestroyTexture)>(
      SDL_CreateTextureFromSurface(p_renderer, surface.get()), SDL_DestroyTexture);

  if (!texture) {
    TEXTURE_ERROR("Could not create texture: " + std::string(SDL_GetError()));
    return false;
  }

  // Pixel art: nearest-pixel sampling avoids bleeding between atlas regions
  SDL_SetTextureScaleMode(texture.get(), SDL_SCALEMODE_NEAREST);

  TextureData data;
  data.width = static_cast<float>(surface->w);
  data.height = static_cast<float>(surface->h);
  data.texture = std::shared_ptr<SDL_Texture>(texture.release(), SDL_DestroyTexture);
  m_textureMap[textureID] = std::move(data);
  m_isShutdown = false;

  TEXTURE_INFO(std::format("Loaded texture '{}' from {}", textureID, fileName));
  return true;
}

void TextureManager::drawRegion(const std::string& textureID,
                                const SDL_FRect& srcRect,
                                const SDL_FRect& destRect,
                                SDL_Renderer* p_renderer,
                                const Color& tint,
                                SDL_FlipMode flip) {
  auto it = m_textureMap.find(textureID);
  if (it == m_textureMap.end()) {
    return;
  }

  SDL_Texture* texture = it->second.texture.get();
  SDL_SetTextureColorModFloat(texture, tint.r, tint.g, tint.b);
  SDL_SetTextureAlphaModFloat(texture, tint.a);
  SDL_RenderTextureRotated(p_renderer, texture, &srcRect, &destRect, 0.0, nullptr, flip);
}

void TextureManager::clearFromTexMap(const std::string& textureID) {
  m_textureMap.erase(textureID);
}

bool TextureManager::isTextureInMap(const std::string& textureID) const {
  return m_textureMap.find(textureID) != m_textureMap.end();
}

const TextureData* TextureManager::getTextureData(const std::string& textureID) const {
  auto it = m_textureMap.find(textureID);
  return it == m_textureMap.end() ? nullptr : &it->second;
}

void TextureManager::clean() {
  TEXTURE_INFO(std::format("Cleaning up {} textures", m_textureMap.size()));
  m_textureMap.clear();
  m_isShutdown = true;
}

} // namespace TesselEngine
