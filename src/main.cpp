/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/EngineConfig.hpp"
#include "core/GameEngine.hpp"
#include "core/Logger.hpp"
#include "gameStates/GamePlayState.hpp"
#include <format>
#include <memory>
#include <string>

namespace {
const std::string DEFAULT_CONFIG_PATH{"res/engine.json"};
}

int main(int argc, char* argv[]) {
  using namespace TesselEngine;

  const std::string configPath = argc > 1 ? argv[1] : DEFAULT_CONFIG_PATH;

  EngineConfig config;
  const bool configLoaded = EngineConfig::loadFromFile(configPath, config);
  Logger::SetMaxLevel(config.logLevel);
  Logger::SetLogDirectory(config.logDirectory, config.logFilesKept);
  if (!configLoaded) {
    GAMEENGINE_WARN(std::format("Failed to load {} - using defaults", configPath));
  }

  GAMEENGINE_INFO(std::format("Initializing {}", config.windowTitle));

  GameEngine gameEngine;
  if (!gameEngine.init(config)) {
    GAMEENGINE_CRITICAL(std::format("Init {} Failed", config.windowTitle));
    gameEngine.clean();
    return -1;
  }

  gameEngine.setState(std::make_unique<GamePlayState>(gameEngine));

  GAMEENGINE_INFO("Starting Main Loop");
  FrameTimer& timer = gameEngine.getFrameTimer();

  // One World tick per rendered frame
  while (gameEngine.isRunning()) {
    const float deltaTime = timer.startFrame();
    gameEngine.handleEvents();
    gameEngine.update(deltaTime);
    timer.endFrame();
  }

  GAMEENGINE_INFO(std::format("Game {} shutting down", config.windowTitle));
  gameEngine.clean();
  return 0;
}
