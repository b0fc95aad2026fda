#include "games/reversi/GameState.hpp"

#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"

namespace reversi {

GameState::GameState() : cur_player_(kStartingPiece) {
  grid_.set(*TilePos::make(kStartingWhiteRow1, kStartingWhiteCol1), Piece::kWhite);
  grid_.set(*TilePos::make(kStartingWhiteRow2, kStartingWhiteCol2), Piece::kWhite);
  grid_.set(*TilePos::make(kStartingBlackRow1, kStartingBlackCol1), Piece::kBlack);
  grid_.set(*TilePos::make(kStartingBlackRow2, kStartingBlackCol2), Piece::kBlack);
}

GameState::GameState(const Grid& grid, Piece to_move) : grid_(grid), cur_player_(to_move) {
  assign_turn(to_move);
}

TilePosList GameState::valid_moves(Piece player) const {
  TilePosList moves;
  for (int i = 0; i < kNumCells; ++i) {
    TilePos pos = TilePos::from_index(i);
    if (is_valid_move(pos, player)) {
      moves.push_back(pos);
    }
  }
  return moves;
}

bool GameState::is_valid_move(const TilePos& pos, Piece player) const {
  if (grid_.get(pos)) return false;

  for (const Direction& dir : kDirections) {
    if (capture_length(pos, dir, player) > 0) return true;
  }
  return false;
}

bool GameState::has_valid_move(Piece player) const {
  for (int i = 0; i < kNumCells; ++i) {
    if (is_valid_move(TilePos::from_index(i), player)) return true;
  }
  return false;
}

TilePosList GameState::get_flips(const TilePos& pos, Piece player) const {
  TilePosList flips;
  if (grid_.get(pos)) return flips;

  for (const Direction& dir : kDirections) {
    int n = capture_length(pos, dir, player);
    std::optional<TilePos> cur = pos;
    for (int k = 0; k < n; ++k) {
      cur = cur->translate(dir);
      flips.push_back(*cur);
    }
  }
  return flips;
}

void GameState::apply_move(const TilePos& pos, Piece player) {
  if (is_terminal()) {
    throw TerminalStateError("Cannot play {}: the game is over", pos.to_str());
  }
  if (player != cur_player_) {
    throw InvalidMoveError("Cannot play {} for {}: it is {}'s turn", pos.to_str(),
                           piece_name(player), piece_name(cur_player_));
  }

  TilePosList flips = get_flips(pos, player);
  if (flips.empty()) {
    throw InvalidMoveError("Invalid move: {}", pos.to_str());
  }

  // Nothing below can fail, so the state is never partially mutated.
  grid_.set(pos, player);
  for (const TilePos& flip : flips) {
    grid_.set(flip, player);
  }
  assign_turn(opposite(player));

  LOG_DEBUG("apply_move: {} {} flips={}", piece_name(player), pos.to_str(), flips.size());
  if (cur_player_ == player) {
    if (has_valid_move(player)) {
      LOG_DEBUG("apply_move: {} cannot reply", piece_name(opposite(player)));
    } else {
      LOG_DEBUG("apply_move: game over");
    }
  }
}

Scores GameState::scores() const {
  Scores scores;
  for (Piece p : kAllPieces) {
    scores[p] = grid_.count(p);
  }
  return scores;
}

bool GameState::is_terminal() const {
  return !has_valid_move(cur_player_) && !has_valid_move(opposite(cur_player_));
}

std::optional<Piece> GameState::winner() const {
  Scores s = scores();
  if (s[Piece::kBlack] > s[Piece::kWhite]) return Piece::kBlack;
  if (s[Piece::kWhite] > s[Piece::kBlack]) return Piece::kWhite;
  return std::nullopt;
}

size_t GameState::hash() const {
  size_t h = std::hash<int>{}(to_index(cur_player_));
  for (const Grid::Row& row : grid_.rows()) {
    for (const Grid::Tile& tile : row.tiles) {
      int v = tile ? to_index(*tile) + 1 : 0;
      h = h * 3 + v;
    }
  }
  return h;
}

int GameState::capture_length(const TilePos& pos, const Direction& dir, Piece player) const {
  Piece opponent = opposite(player);
  int n = 0;
  std::optional<TilePos> cur = pos.translate(dir);
  while (cur) {
    Grid::Tile tile = grid_.get(*cur);
    if (!tile) return 0;
    if (*tile == player) return n;
    DEBUG_ASSERT(*tile == opponent);
    ++n;
    cur = cur->translate(dir);
  }
  return 0;
}

void GameState::assign_turn(Piece preferred) {
  cur_player_ = has_valid_move(preferred) ? preferred : opposite(preferred);
}

}  // namespace reversi
