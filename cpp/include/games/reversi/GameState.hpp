#pragma once

#include "games/reversi/BasicTypes.hpp"
#include "games/reversi/Constants.hpp"
#include "games/reversi/Errors.hpp"
#include "games/reversi/Grid.hpp"
#include "games/reversi/Piece.hpp"
#include "games/reversi/TilePos.hpp"

#include <array>
#include <cstddef>
#include <functional>
#include <optional>

namespace reversi {

/*
 * Per-piece tile counts.
 */
struct Scores {
  int operator[](Piece p) const { return counts[to_index(p)]; }
  int& operator[](Piece p) { return counts[to_index(p)]; }
  int total() const { return counts[0] + counts[1]; }

  // counts[to_index(p)] is the number of tiles occupied by p.
  std::array<int, kNumPlayers> counts = {};
};

/*
 * A Grid plus the player on turn.
 *
 * GameState enforces the rules: legality, capture flips, the pass rule and terminal detection. It
 * is mutated only via apply_move(), which is all-or-nothing: on any failure the state is left
 * untouched.
 *
 * Pass rule: after a move, the turn goes to the opponent if the opponent has a valid move;
 * otherwise the mover moves again. If neither player can move, the state is terminal, and
 * terminal is absorbing. As a consequence, in any non-terminal state the player on turn has at
 * least one valid move.
 *
 * GameState is a small value type. The search explores successors via independent copies.
 */
class GameState {
 public:
  // Canonical starting position, black to move.
  GameState();

  // Arbitrary position. If to_move has no valid move but the opponent does, the opponent is put on
  // turn.
  GameState(const Grid& grid, Piece to_move);

  const Grid& grid() const { return grid_; }
  Piece current_player() const { return cur_player_; }

  // Empty positions where player's placement would capture at least one opposing run, in
  // row-major order.
  TilePosList valid_moves(Piece player) const;
  TilePosList valid_moves() const { return valid_moves(cur_player_); }

  // Agrees exactly with membership in valid_moves(player).
  bool is_valid_move(const TilePos& pos, Piece player) const;

  bool has_valid_move(Piece player) const;

  // Opponent tiles that placing player's piece at pos would flip, grouped by direction in
  // kDirections order, nearest first. Empty if pos is occupied or captures nothing.
  TilePosList get_flips(const TilePos& pos, Piece player) const;

  /*
   * Places player's piece at pos, flips every captured run, and passes the turn according to the
   * pass rule.
   *
   * Throws TerminalStateError if the state is terminal, and InvalidMoveError if player is not on
   * turn or the move is illegal. In both cases the state is unchanged.
   */
  void apply_move(const TilePos& pos, Piece player);
  void apply_move(const TilePos& pos) { apply_move(pos, cur_player_); }

  Scores scores() const;

  // True iff neither player has a valid move. A full board is a special case.
  bool is_terminal() const;

  // The piece with more tiles, or std::nullopt on a tie.
  std::optional<Piece> winner() const;

  size_t hash() const;

  bool operator==(const GameState&) const = default;

 private:
  // Number of opponent pieces that player captures along dir when placing at pos. 0 if the run
  // is empty, interrupted by an empty tile, or runs off the board without reaching an anchor.
  int capture_length(const TilePos& pos, const Direction& dir, Piece player) const;

  // Puts preferred on turn if it has a valid move, and its opponent otherwise.
  void assign_turn(Piece preferred);

  Grid grid_;
  Piece cur_player_;
};

}  // namespace reversi

namespace std {

template <>
struct hash<reversi::GameState> {
  size_t operator()(const reversi::GameState& state) const { return state.hash(); }
};

}  // namespace std
