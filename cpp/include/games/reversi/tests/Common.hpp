#pragma once

#include "games/reversi/GameState.hpp"
#include "games/reversi/Grid.hpp"
#include "games/reversi/Piece.hpp"

#include <string>

/*
 * This file contains unit-testing code shared by the reversi test binaries.
 */

namespace reversi {
namespace tests {

/*
 * Builds a Grid from a board drawn in the IO::print_state() text format:
 *
 *   "   A B C D E F G H\n"
 *   " 1| | | | | | | | |\n"
 *   ...
 *   " 8| | | | | | | | |\n"
 *
 * '*' is black and '0' is white. Any other cell character, including the '.' valid-move marker,
 * is read as empty. Throws util::Exception on malformed input.
 */
Grid make_grid(const std::string& board);

// GameState(make_grid(board), to_move).
GameState make_state(const std::string& board, Piece to_move);

// The board part of IO::print_state() output, without the score lines.
std::string get_repr(const GameState& state);

}  // namespace tests
}  // namespace reversi

#include "inline/games/reversi/tests/Common.inl"
