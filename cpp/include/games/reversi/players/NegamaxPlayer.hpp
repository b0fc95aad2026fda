#pragma once

#include "games/reversi/GameState.hpp"
#include "games/reversi/Negamax.hpp"
#include "games/reversi/TilePos.hpp"
#include "games/reversi/players/AbstractPlayer.hpp"

namespace reversi {

/*
 * Plays Negamax::best_move() at the configured depth.
 */
class NegamaxPlayer : public AbstractPlayer {
 public:
  NegamaxPlayer(const Negamax::Params& params) : negamax_(params) {}

  TilePos get_move(const GameState& state) override;

 private:
  Negamax negamax_;
};

}  // namespace reversi
