/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - Required for the runtime level threshold
#include <cstddef>
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <optional>
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros
#include <string_view>

namespace TesselEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release for crashes)
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

const char *logLevelName(LogLevel level);

/**
 * @brief Parses "critical", "error", "warning", "info" or "debug" (any case)
 */
std::optional<LogLevel> parseLogLevel(std::string_view name);

/**
 * @brief Process-wide logger behind the per-system macros below
 *
 * Debug builds print every level to stdout. Release builds compile WARN, INFO
 * and DEBUG out entirely and append CRITICAL and ERROR to
 * <directory>/tessel_<timestamp>.log. In both builds messages above the
 * runtime threshold set with SetMaxLevel() are dropped.
 */
class Logger {
public:
  static void SetMaxLevel(LogLevel level) {
    s_maxLevel.store(level, std::memory_order_relaxed);
  }

  static LogLevel GetMaxLevel() {
    return s_maxLevel.load(std::memory_order_relaxed);
  }

  static bool IsEnabled(LogLevel level) {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(GetMaxLevel());
  }

  /**
   * @brief Sets where release builds write their log file
   *
   * Only the newest keepFiles logs are kept. Has no effect once the first
   * message has been written.
   */
  static void SetLogDirectory(const std::string &directory, size_t keepFiles = 5);

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message);

private:
  static inline std::atomic<LogLevel> s_maxLevel{LogLevel::DEBUG_LEVEL};
};

#define TESSEL_CRITICAL(system, msg)                                           \
  TesselEngine::Logger::Log(TesselEngine::LogLevel::CRITICAL, system, msg)
#define TESSEL_ERROR(system, msg)                                              \
  TesselEngine::Logger::Log(TesselEngine::LogLevel::ERROR_LEVEL, system, msg)

#ifdef DEBUG
#define TESSEL_WARN(system, msg)                                               \
  TesselEngine::Logger::Log(TesselEngine::LogLevel::WARNING, system, msg)
#define TESSEL_INFO(system, msg)                                               \
  TesselEngine::Logger::Log(TesselEngine::LogLevel::INFO, system, msg)
#define TESSEL_DEBUG(system, msg)                                              \
  TesselEngine::Logger::Log(TesselEngine::LogLevel::DEBUG_LEVEL, system, msg)
#else
#define TESSEL_WARN(system, msg) ((void)0)  // Zero overhead
#define TESSEL_INFO(system, msg) ((void)0)  // Zero overhead
#define TESSEL_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Convenience macros for each system

// Core Systems
#define GAMEENGINE_CRITICAL(msg) TESSEL_CRITICAL("GameEngine", msg)
#define GAMEENGINE_ERROR(msg) TESSEL_ERROR("GameEngine", msg)
#define GAMEENGINE_WARN(msg) TESSEL_WARN("GameEngine", msg)
#define GAMEENGINE_INFO(msg) TESSEL_INFO("GameEngine", msg)
#define GAMEENGINE_DEBUG(msg) TESSEL_DEBUG("GameEngine", msg)

#define WORLD_CRITICAL(msg) TESSEL_CRITICAL("World", msg)
#define WORLD_ERROR(msg) TESSEL_ERROR("World", msg)
#define WORLD_WARN(msg) TESSEL_WARN("World", msg)
#define WORLD_INFO(msg) TESSEL_INFO("World", msg)
#define WORLD_DEBUG(msg) TESSEL_DEBUG("World", msg)

#define CONFIG_CRITICAL(msg) TESSEL_CRITICAL("EngineConfig", msg)
#define CONFIG_ERROR(msg) TESSEL_ERROR("EngineConfig", msg)
#define CONFIG_WARN(msg) TESSEL_WARN("EngineConfig", msg)
#define CONFIG_INFO(msg) TESSEL_INFO("EngineConfig", msg)
#define CONFIG_DEBUG(msg) TESSEL_DEBUG("EngineConfig", msg)

#define EVENT_CRITICAL(msg) TESSEL_CRITICAL("EventDispatcher", msg)
#define EVENT_ERROR(msg) TESSEL_ERROR("EventDispatcher", msg)
#define EVENT_WARN(msg) TESSEL_WARN("EventDispatcher", msg)
#define EVENT_INFO(msg) TESSEL_INFO("EventDispatcher", msg)
#define EVENT_DEBUG(msg) TESSEL_DEBUG("EventDispatcher", msg)

// Asset Systems
#define TEXTURE_CRITICAL(msg) TESSEL_CRITICAL("TextureManager", msg)
#define TEXTURE_ERROR(msg) TESSEL_ERROR("TextureManager", msg)
#define TEXTURE_WARN(msg) TESSEL_WARN("TextureManager", msg)
#define TEXTURE_INFO(msg) TESSEL_INFO("TextureManager", msg)
#define TEXTURE_DEBUG(msg) TESSEL_DEBUG("TextureManager", msg)

#define ATLAS_CRITICAL(msg) TESSEL_CRITICAL("TextureAtlas", msg)
#define ATLAS_ERROR(msg) TESSEL_ERROR("TextureAtlas", msg)
#define ATLAS_WARN(msg) TESSEL_WARN("TextureAtlas", msg)
#define ATLAS_INFO(msg) TESSEL_INFO("TextureAtlas", msg)
#define ATLAS_DEBUG(msg) TESSEL_DEBUG("TextureAtlas", msg)

#define TILEMAP_CRITICAL(msg) TESSEL_CRITICAL("TileMapLoader", msg)
#define TILEMAP_ERROR(msg) TESSEL_ERROR("TileMapLoader", msg)
#define TILEMAP_WARN(msg) TESSEL_WARN("TileMapLoader", msg)
#define TILEMAP_INFO(msg) TESSEL_INFO("TileMapLoader", msg)
#define TILEMAP_DEBUG(msg) TESSEL_DEBUG("TileMapLoader", msg)

// Entity Systems
#define ENTITY_CRITICAL(msg) TESSEL_CRITICAL("EntityRegistry", msg)
#define ENTITY_ERROR(msg) TESSEL_ERROR("EntityRegistry", msg)
#define ENTITY_WARN(msg) TESSEL_WARN("EntityRegistry", msg)
#define ENTITY_INFO(msg) TESSEL_INFO("EntityRegistry", msg)
#define ENTITY_DEBUG(msg) TESSEL_DEBUG("EntityRegistry", msg)

#define ANIMATION_CRITICAL(msg) TESSEL_CRITICAL("AnimationSystem", msg)
#define ANIMATION_ERROR(msg) TESSEL_ERROR("AnimationSystem", msg)
#define ANIMATION_WARN(msg) TESSEL_WARN("AnimationSystem", msg)
#define ANIMATION_INFO(msg) TESSEL_INFO("AnimationSystem", msg)
#define ANIMATION_DEBUG(msg) TESSEL_DEBUG("AnimationSystem", msg)

#define SPAWN_CRITICAL(msg) TESSEL_CRITICAL("EntitySpawnSystem", msg)
#define SPAWN_ERROR(msg) TESSEL_ERROR("EntitySpawnSystem", msg)
#define SPAWN_WARN(msg) TESSEL_WARN("EntitySpawnSystem", msg)
#define SPAWN_INFO(msg) TESSEL_INFO("EntitySpawnSystem", msg)
#define SPAWN_DEBUG(msg) TESSEL_DEBUG("EntitySpawnSystem", msg)

#define RENDER_CRITICAL(msg) TESSEL_CRITICAL("RenderSystem", msg)
#define RENDER_ERROR(msg) TESSEL_ERROR("RenderSystem", msg)
#define RENDER_WARN(msg) TESSEL_WARN("RenderSystem", msg)
#define RENDER_INFO(msg) TESSEL_INFO("RenderSystem", msg)
#define RENDER_DEBUG(msg) TESSEL_DEBUG("RenderSystem", msg)

#define GAMEPLAY_CRITICAL(msg) TESSEL_CRITICAL("GamePlayState", msg)
#define GAMEPLAY_ERROR(msg) TESSEL_ERROR("GamePlayState", msg)
#define GAMEPLAY_WARN(msg) TESSEL_WARN("GamePlayState", msg)
#define GAMEPLAY_INFO(msg) TESSEL_INFO("GamePlayState", msg)
#define GAMEPLAY_DEBUG(msg) TESSEL_DEBUG("GamePlayState", msg)

} // namespace TesselEngine

#endif // LOGGER_HPP
