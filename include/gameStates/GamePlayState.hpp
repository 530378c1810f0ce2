/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_PLAY_STATE_HPP
#define GAME_PLAY_STATE_HPP

#include "assets/TextureAtlas.hpp"
#include "gameStates/GameState.hpp"
#include <memory>
#include <string>

namespace TesselEngine {

class GameEngine;
class SDLTileLayerRenderer;
class World;
struct TileMap;

/**
 * @brief Loads the atlas and the configured map, then runs the World every frame
 *
 * This state is where pipeline errors stop: a failed load, map change or
 * tick is logged and the game keeps running (without a map if loading failed).
 */
class GamePlayState : public GameState {
public:
  explicit GamePlayState(GameEngine& engine);
  ~GamePlayState() override;

  bool enter() override;
  void update(float deltaTime) override;
  bool exit() override;
  std::string getName() const override { return "GamePlayState"; }

  /**
   * @brief Loads a map file with its tileset textures and makes it active
   * @return false if the map could not be loaded or activated
   */
  bool loadMap(const std::string& mapPath);

private:
  bool loadAtlas(const std::string& atlasPath);
  void loadTilesetTextures(const TileMap& map);

  GameEngine& m_engine;
  TextureAtlas m_atlas;
  std::unique_ptr<SDLTileLayerRenderer> mp_tileRenderer{nullptr};
  std::unique_ptr<World> mp_world{nullptr};
  bool m_initialized{false};
};

} // namespace TesselEngine

#endif // GAME_PLAY_STATE_HPP
