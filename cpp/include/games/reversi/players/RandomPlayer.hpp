#pragma once

#include "games/reversi/GameState.hpp"
#include "games/reversi/TilePos.hpp"
#include "games/reversi/players/AbstractPlayer.hpp"

namespace reversi {

/*
 * Plays a uniformly random valid move, using util::Random's default prng.
 */
class RandomPlayer : public AbstractPlayer {
 public:
  TilePos get_move(const GameState& state) override;
};

}  // namespace reversi
