/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_ENGINE_HPP
#define GAME_ENGINE_HPP

#include "core/EngineConfig.hpp"
#include "core/FrameTimer.hpp"
#include "managers/TextureManager.hpp"
#include <SDL3/SDL.h>
#include <memory>

namespace TesselEngine {

class GameState;
class SDLStage;

/**
 * @brief Owns the SDL window, renderer, textures, stage and the active state
 *
 * Usage (see main.cpp):
 *   GameEngine engine;
 *   if (!engine.init(config)) { ... }
 *   engine.setState(std::make_unique<GamePlayState>(engine));
 *   while (engine.isRunning()) { ... engine.handleEvents(); engine.update(dt); }
 *   engine.clean();
 */
class GameEngine {
 public:
  GameEngine() = default;
  ~GameEngine();

  GameEngine(const GameEngine&) = delete;
  GameEngine& operator=(const GameEngine&) = delete;

  /**
   * @brief Initializes SDL video, the window, the renderer and the stage
   * @return false on any SDL failure, SDL_GetError() has the details
   */
  bool init(const EngineConfig& config);

  /**
   * @brief Exits the current state and enters the new one
   */
  void setState(std::unique_ptr<GameState> state);

  void handleEvents();

  /**
   * @brief Clears the frame, runs the active state and presents
   */
  void update(float deltaTime);

  void clean();

  bool isRunning() const noexcept { return m_running; }
  void setRunning(bool running) noexcept { m_running = running; }

  SDL_Renderer* getRenderer() const noexcept { return mp_renderer.get(); }
  SDL_Window* getWindow() const noexcept { return mp_window.get(); }
  TextureManager& getTextureManager() noexcept { return m_textureManager; }
  SDLStage& getStage() noexcept { return *mp_stage; }
  FrameTimer& getFrameTimer() noexcept { return m_frameTimer; }
  const EngineConfig& getConfig() const noexcept { return m_config; }

 private:
  EngineConfig m_config{};
  bool m_sdlInitialized{false};
  bool m_running{false};
  FrameTimer m_frameTimer{};

  // Declaration order is teardown order in reverse: the state goes first,
  // then the stage, the textures and finally the renderer and window
  std::unique_ptr<SDL_Window, decltype(&SDL_DestroyWindow)> mp_window{
      nullptr, SDL_DestroyWindow};
  std::unique_ptr<SDL_Renderer, decltype(&SDL_DestroyRenderer)> mp_renderer{
      nullptr, SDL_DestroyRenderer};
  TextureManager m_textureManager{};
  std::unique_ptr<SDLStage> mp_stage{nullptr};
  std::unique_ptr<GameState> mp_state{nullptr};
};

} // namespace TesselEngine

#endif // GAME_ENGINE_HPP
