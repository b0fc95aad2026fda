#pragma once

#include "games/reversi/BasicTypes.hpp"
#include "games/reversi/GameState.hpp"
#include "games/reversi/Piece.hpp"

#include <cstdint>
#include <string>

namespace reversi {

/*
 * Static evaluation of a position, from the perspective of a given player. Every evaluation is
 * antisymmetric: evaluate(s, p) == -evaluate(s, opposite(p)). Negamax relies on this.
 */
class Evaluator {
 public:
  enum Mode : int8_t {
    kPieceCount,  // scores()[me] - scores()[opponent]
    kPositional   // piece count plus corner and side bonuses
  };

  explicit Evaluator(Mode mode = kPieceCount) : mode_(mode) {}

  // Accepts "piece-count" or "positional". Throws util::CleanException otherwise.
  static Mode parse_mode(const std::string& s);
  static const char* mode_to_str(Mode mode);

  Mode mode() const { return mode_; }

  score_t evaluate(const GameState& state, Piece perspective) const;

  static score_t piece_differential(const GameState& state, Piece perspective);

  /*
   * Corner tiles are worth kCornerBonus. Edge tiles are worth kSideBonus per board edge they lie
   * on, so each corner additionally collects 2 * kSideBonus.
   */
  static score_t positional_bonus(const GameState& state, Piece perspective);

 private:
  Mode mode_;
};

}  // namespace reversi
