#include "games/reversi/players/NegamaxPlayer.hpp"

#include "util/LoggingUtil.hpp"

namespace reversi {

TilePos NegamaxPlayer::get_move(const GameState& state) {
  Negamax::SearchResult result = negamax_.best_move(state);
  const Negamax::Stats& stats = negamax_.stats();
  LOG_INFO("{} ({}) chose {} score={} nodes={}", get_name(), piece_name(get_my_piece()),
           result.move.to_str(), result.score, stats.nodes);
  return result.move;
}

}  // namespace reversi
