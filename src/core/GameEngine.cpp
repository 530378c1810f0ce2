/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/GameEngine.hpp"
#include "core/Logger.hpp"
#include "gameStates/GameState.hpp"
#include "render/SDLStage.hpp"
#include <format>

namespace TesselEngine {

GameEngine::~GameEngine() {
  if (m_sdlInitialized) {
    clean();
  }
}

bool GameEngine::init(const EngineConfig& config) {
  m_config = config;

  if (!SDL_Init(SDL_INIT_VIDEO)) {
    GAMEENGINE_CRITICAL(std::format("SDL initialization failed: {}", SDL_GetError()));
    return false;
  }
  m_sdlInitialized = true;

  mp_window.reset(SDL_CreateWindow(m_config.windowTitle.c_str(), m_config.windowWidth,
                                   m_config.windowHeight, SDL_WINDOW_RESIZABLE));
  if (!mp_window) {
    GAMEENGINE_CRITICAL(std::format("Window creation failed: {}", SDL_GetError()));
    return false;
  }

  mp_renderer.reset(SDL_CreateRenderer(mp_window.get(), nullptr));
  if (!mp_renderer) {
    GAMEENGINE_CRITICAL(std::format("Renderer creation failed: {}", SDL_GetError()));
    return false;
  }

  // Fall back to software frame limiting when the driver refuses VSync
  if (!SDL_SetRenderVSync(mp_renderer.get(), 1)) {
    GAMEENGINE_WARN(std::format("VSync unavailable ({}), using software frame limiting",
                                SDL_GetError()));
    m_frameTimer.setSoftwareFrameLimiting(true);
  }

  SDL_SetRenderDrawBlendMode(mp_renderer.get(), SDL_BLENDMODE_BLEND);

  mp_stage = std::make_unique<SDLStage>(mp_renderer.get(), m_textureManager,
                                        m_config.viewportWidth, m_config.viewportHeight);
  m_running = true;

  GAMEENGINE_INFO(std::format("Initialized {}x{} window '{}'", m_config.windowWidth,
                              m_config.windowHeight, m_config.windowTitle));
  return true;
}

void GameEngine::setState(std::unique_ptr<GameState> state) {
  if (mp_state) {
    GAMEENGINE_INFO("Exiting state " + mp_state->getName());
    mp_state->exit();
    mp_state.reset();
  }

  mp_state = std::move(state);
  if (mp_state && !mp_state->enter()) {
    GAMEENGINE_ERROR("Failed to enter state " + mp_state->getName());
  }
}

void GameEngine::handleEvents() {
  SDL_Event event;
  while (SDL_PollEvent(&event)) {
    switch (event.type) {
      case SDL_EVENT_QUIT:
        m_running = false;
        break;
      case SDL_EVENT_KEY_DOWN:
        if (event.key.key == SDLK_ESCAPE) {
          m_running = false;
        }
        break;
      case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
        // The stage recomputes its viewport from the output size every frame
        GAMEENGINE_DEBUG(std::format("Window resized to {}x{}", event.window.data1,
                                     event.window.data2));
        break;
      default:
        break;
    }
  }
}

void GameEngine::update(float deltaTime) {
  SDL_SetRenderDrawColor(mp_renderer.get(), 0, 0, 0, 255);
  SDL_RenderClear(mp_renderer.get());

  if (mp_state) {
    mp_state->update(deltaTime);
  }

  SDL_RenderPresent(mp_renderer.get());
}

void GameEngine::clean() {
  GAMEENGINE_INFO("Cleaning up engine resources");

  if (mp_state) {
    mp_state->exit();
    mp_state.reset();
  }
  mp_stage.reset();
  m_textureManager.clean();
  mp_renderer.reset();
  mp_window.reset();

  if (m_sdlInitialized) {
    SDL_Quit();
    m_sdlInitialized = false;
  }
  m_running = false;
}

} // namespace TesselEngine
