#pragma once

#include "games/reversi/GameState.hpp"
#include "games/reversi/Piece.hpp"
#include "games/reversi/TilePos.hpp"

#include <array>
#include <optional>
#include <ostream>
#include <string>

namespace reversi {

/*
 * Text rendering of positions.
 *
 * Board format (util::Rendering::kText mode):
 *
 *    A B C D E F G H
 *  1| | | | | | | | |
 *  2| | | | | | | | |
 *  3| | | |.| | | | |
 *  4| | |.|0|*| | | |
 *  5| | | |*|0|.| | |
 *  6| | | | |.| | | |
 *  7| | | | | | | | |
 *  8| | | | | | | | |
 *
 * '*' is black, '0' is white, '.' marks a valid move for the player on turn. In
 * util::Rendering::kTerminal mode, pieces are drawn as colored circles and the last move blinks;
 * in kText mode the last move is marked with an 'x' above its column and beside its row.
 */
struct IO {
  using player_name_array_t = std::array<std::string, kNumPlayers>;

  static std::string piece_to_str(Piece piece);

  static void print_state(std::ostream& os, const GameState& state,
                          std::optional<TilePos> last_move = std::nullopt,
                          const player_name_array_t* player_names = nullptr);

 private:
  static std::string row_to_str(const GameState& state, const Grid::Row& row,
                                const TilePosList& valid_moves, int blink_col);
};

}  // namespace reversi
