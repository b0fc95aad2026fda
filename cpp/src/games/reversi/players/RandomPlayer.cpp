#include "games/reversi/players/RandomPlayer.hpp"

#include "util/Random.hpp"

namespace reversi {

TilePos RandomPlayer::get_move(const GameState& state) {
  TilePosList moves = state.valid_moves();
  return *util::Random::choose(moves.begin(), moves.end());
}

}  // namespace reversi
