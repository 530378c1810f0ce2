/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "gameStates/GamePlayState.hpp"
#include "core/GameEngine.hpp"
#include "core/Logger.hpp"
#include "core/World.hpp"
#include "render/SDLStage.hpp"
#include "render/SDLTileLayerRenderer.hpp"
#include "world/TileMapLoader.hpp"
#include <exception>
#include <format>

namespace TesselEngine {

GamePlayState::GamePlayState(GameEngine& engine)
    : m_engine(engine) {}

GamePlayState::~GamePlayState() = default;

bool GamePlayState::enter() {
  if (m_initialized) {
    return true;
  }

  const EngineConfig& config = m_engine.getConfig();
  if (!loadAtlas(config.atlasPath)) {
    GAMEPLAY_WARN("Continuing without atlas, spawned entities will fail to materialize");
  }

  mp_tileRenderer = std::make_unique<SDLTileLayerRenderer>(
      m_engine.getStage(), m_engine.getTextureManager(), config.unitScale);
  mp_world = std::make_unique<World>(config, m_atlas, m_engine.getStage(), *mp_tileRenderer);
  m_initialized = true;

  if (!loadMap(config.mapPath)) {
    GAMEPLAY_WARN("Continuing without a map");
  }
  return true;
}

void GamePlayState::update(float deltaTime) {
  if (!mp_world) {
    return;
  }

  try {
    mp_world->update(deltaTime);
  } catch (const std::exception& e) {
    GAMEPLAY_ERROR(std::format("World tick failed: {}", e.what()));
  }
}

bool GamePlayState::exit() {
  // World first: its registry removes drawables from the stage
  mp_world.reset();
  mp_tileRenderer.reset();
  m_atlas.clear();
  m_initialized = false;
  return true;
}

bool GamePlayState::loadMap(const std::string& mapPath) {
  if (!mp_world) {
    GAMEPLAY_ERROR("loadMap called before enter()");
    return false;
  }

  TileMapLoader loader;
  std::shared_ptr<TileMap> map = loader.loadFromFile(mapPath);
  if (!map) {
    GAMEPLAY_ERROR(std::format("Failed to load map {}: {}", mapPath, loader.getLastError()));
    return false;
  }

  loadTilesetTextures(*map);

  try {
    mp_world->changeMap(std::move(map));
  } catch (const std::exception& e) {
    GAMEPLAY_ERROR(std::format("Failed to activate map {}: {}", mapPath, e.what()));
    return false;
  }

  GAMEPLAY_INFO(std::format("Map {} active with {} spawn requests queued", mapPath,
                            mp_world->getRegistry().getSpawnRequests().size()));
  return true;
}

bool GamePlayState::loadAtlas(const std::string& atlasPath) {
  if (!m_atlas.loadFromFile(atlasPath)) {
    GAMEPLAY_ERROR(std::format("Failed to load atlas {}: {}", atlasPath, m_atlas.getLastError()));
    return false;
  }

  if (!m_engine.getTextureManager().load(m_atlas.getImagePath(), m_atlas.getTextureId(),
                                         m_engine.getRenderer())) {
    GAMEPLAY_ERROR("Failed to load atlas image " + m_atlas.getImagePath());
    return false;
  }
  return true;
}

void GamePlayState::loadTilesetTextures(const TileMap& map) {
  TextureManager& textures = m_engine.getTextureManager();
  for (const Tileset& tileset : map.tilesets) {
    const std::string textureId = SDLTileLayerRenderer::textureIdFor(tileset);
    if (tileset.imagePath.empty() || textures.isTextureInMap(textureId)) {
      continue;
    }
    if (!textures.load(tileset.imagePath, textureId, m_engine.getRenderer())) {
      GAMEPLAY_WARN("Tileset '" + tileset.name + "' has no texture, its tiles are skipped");
    }
  }
}

} // namespace TesselEngine
