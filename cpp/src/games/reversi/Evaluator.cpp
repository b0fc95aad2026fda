#include "games/reversi/Evaluator.hpp"

#include "games/reversi/Constants.hpp"
#include "util/Exception.hpp"

namespace reversi {

namespace {

score_t tile_value(const Grid& grid, int row, int col, Piece perspective, int value) {
  Grid::Tile tile = grid.get(*TilePos::make(row, col));
  if (!tile) return 0;
  return *tile == perspective ? value : -value;
}

}  // namespace

Evaluator::Mode Evaluator::parse_mode(const std::string& s) {
  if (s == "piece-count") return kPieceCount;
  if (s == "positional") return kPositional;
  throw util::CleanException("Unknown evaluator \"{}\" (expected piece-count or positional)", s);
}

const char* Evaluator::mode_to_str(Mode mode) {
  switch (mode) {
    case kPieceCount:
      return "piece-count";
    case kPositional:
      return "positional";
    default:
      throw util::Exception("Unknown evaluator mode: {}", int(mode));
  }
}

score_t Evaluator::evaluate(const GameState& state, Piece perspective) const {
  switch (mode_) {
    case kPieceCount:
      return piece_differential(state, perspective);
    case kPositional:
      return piece_differential(state, perspective) + positional_bonus(state, perspective);
    default:
      throw util::Exception("Unknown evaluator mode: {}", int(mode_));
  }
}

score_t Evaluator::piece_differential(const GameState& state, Piece perspective) {
  Scores scores = state.scores();
  return scores[perspective] - scores[opposite(perspective)];
}

score_t Evaluator::positional_bonus(const GameState& state, Piece perspective) {
  const Grid& grid = state.grid();
  constexpr int last = kBoardDimension - 1;

  score_t bonus = 0;
  for (int row : {0, last}) {
    for (int col : {0, last}) {
      bonus += tile_value(grid, row, col, perspective, kCornerBonus);
    }
  }

  for (int i = 0; i < kBoardDimension; ++i) {
    bonus += tile_value(grid, i, 0, perspective, kSideBonus);
    bonus += tile_value(grid, i, last, perspective, kSideBonus);
    bonus += tile_value(grid, 0, i, perspective, kSideBonus);
    bonus += tile_value(grid, last, i, perspective, kSideBonus);
  }
  return bonus;
}

}  // namespace reversi
