#include "games/reversi/Negamax.hpp"

#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"

#include <algorithm>
#include <optional>

namespace reversi {

Negamax::Negamax(const Params& params)
    : params_(params), evaluator_(Evaluator::parse_mode(params.evaluator)) {
  CLEAN_ASSERT(params_.depth >= 1, "Negamax depth must be positive (got {})", params_.depth);
}

score_t Negamax::score(const GameState& state, int depth, Piece perspective) {
  CLEAN_ASSERT(depth >= 0, "Negamax depth must be non-negative (got {})", depth);

  if (depth == 0 || state.is_terminal()) {
    stats_.nodes++;
    stats_.leaves++;
    return evaluator_.evaluate(state, perspective);
  }

  score_t value = search(state, depth, -kInfiniteScore, kInfiniteScore);
  return state.current_player() == perspective ? value : -value;
}

Negamax::SearchResult Negamax::best_move(const GameState& state, int depth) {
  CLEAN_ASSERT(depth >= 1, "Negamax depth must be positive (got {})", depth);
  if (state.is_terminal()) {
    throw TerminalStateError("best_move() called on a terminal state");
  }

  reset_stats();
  stats_.nodes++;

  Piece mover = state.current_player();
  TilePosList moves = state.valid_moves(mover);
  DEBUG_ASSERT(!moves.empty());

  std::optional<SearchResult> best;
  for (const TilePos& move : moves) {
    GameState child = state;
    child.apply_move(move, mover);

    // Only a strictly better value can replace the incumbent, so a window starting at the
    // incumbent's score preserves the first-maximum tie-break.
    score_t alpha = best ? best->score : -kInfiniteScore;
    score_t value = child_value(child, mover, depth - 1, alpha, kInfiniteScore);
    LOG_TRACE("best_move: {} -> {}", move.to_str(), value);

    if (!best || value > best->score) {
      best = SearchResult{move, value};
    }
  }

  LOG_DEBUG("best_move: {} plays {} score={} depth={} nodes={} leaves={} cutoffs={}",
            piece_name(mover), best->move.to_str(), best->score, depth, stats_.nodes,
            stats_.leaves, stats_.cutoffs);
  return *best;
}

score_t Negamax::search(const GameState& state, int depth, score_t alpha, score_t beta) {
  stats_.nodes++;

  Piece mover = state.current_player();
  if (depth == 0 || state.is_terminal()) {
    stats_.leaves++;
    return evaluator_.evaluate(state, mover);
  }

  score_t best = -kInfiniteScore;
  for (const TilePos& move : state.valid_moves(mover)) {
    GameState child = state;
    child.apply_move(move, mover);

    score_t value = child_value(child, mover, depth - 1, alpha, beta);
    best = std::max(best, value);

    if (params_.alpha_beta) {
      alpha = std::max(alpha, best);
      if (alpha >= beta) {
        stats_.cutoffs++;
        break;
      }
    }
  }
  return best;
}

score_t Negamax::child_value(const GameState& child, Piece mover, int depth, score_t alpha,
                             score_t beta) {
  if (child.current_player() == mover) {
    // Opponent had no reply: same perspective, no negation.
    return search(child, depth, alpha, beta);
  }
  return -search(child, depth, -beta, -alpha);
}

}  // namespace reversi
