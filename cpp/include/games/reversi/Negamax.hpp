#pragma once

#include "games/reversi/BasicTypes.hpp"
#include "games/reversi/Constants.hpp"
#include "games/reversi/Evaluator.hpp"
#include "games/reversi/GameState.hpp"
#include "games/reversi/Piece.hpp"
#include "games/reversi/TilePos.hpp"

#include <cstdint>
#include <string>

namespace reversi {

/*
 * Depth-bounded negamax search.
 *
 * Negamax is minimax for zero-sum games, expressed from the perspective of the player on turn: a
 * child's value is negated when the turn changes hands. In Reversi the turn does not always change
 * hands - when the opponent has no reply, apply_move() leaves the mover on turn - so each child is
 * negated only when the player on turn actually differs from the parent's.
 *
 * Each recursive call works on its own copy of the GameState; there is no make/undo.
 *
 * With Params::alpha_beta set, branches that cannot affect the result are pruned. This changes the
 * node count only: the chosen move and its score are identical to the unpruned search, including
 * the tie-break (the first move, in valid_moves() order, that achieves the maximum).
 */
class Negamax {
 public:
  struct Params {
    auto make_options_description();

    int depth = kDefaultSearchDepth;
    std::string evaluator = "piece-count";
    bool alpha_beta = true;
  };

  struct SearchResult {
    TilePos move;
    score_t score;  // from the perspective of the player on turn at the root
  };

  struct Stats {
    int64_t nodes = 0;    // states visited, including the leaves
    int64_t leaves = 0;   // states scored by the evaluator
    int64_t cutoffs = 0;  // alpha-beta cutoffs
  };

  Negamax(const Params& params);

  /*
   * The negamax value of state, searched to the given depth, from perspective's point of view.
   *
   * At depth 0, or if state is terminal, this is exactly the static evaluation, with no
   * recursion. Requires depth >= 0.
   */
  score_t score(const GameState& state, int depth, Piece perspective);

  /*
   * Scores every valid move of the player on turn by searching its successor to depth - 1, and
   * returns the best one.
   *
   * Requires depth >= 1 (throws util::CleanException otherwise). Throws TerminalStateError if state
   * is terminal.
   */
  SearchResult best_move(const GameState& state, int depth);
  SearchResult best_move(const GameState& state) { return best_move(state, params_.depth); }

  // Counters accumulated since the last best_move() or reset_stats() call.
  const Stats& stats() const { return stats_; }
  void reset_stats() { stats_ = Stats(); }

 private:
  // Value of state from the perspective of the player on turn. Fail-soft alpha-beta when enabled.
  score_t search(const GameState& state, int depth, score_t alpha, score_t beta);

  // Value of child from the perspective of mover, the player on turn in child's parent.
  score_t child_value(const GameState& child, Piece mover, int depth, score_t alpha, score_t beta);

  const Params params_;
  const Evaluator evaluator_;
  Stats stats_;
};

}  // namespace reversi

#include "inline/games/reversi/Negamax.inl"
