/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_STATE_HPP
#define GAME_STATE_HPP

#include <string>

namespace TesselEngine {

// pure virtual for inheritance
class GameState {
 public:
  virtual bool enter() = 0;
  // Runs one frame; states draw from inside their update
  virtual void update(float deltaTime) = 0;
  virtual bool exit() = 0;
  virtual std::string getName() const = 0;
  virtual ~GameState() = default;
};

} // namespace TesselEngine

#endif  // GAME_STATE_HPP
