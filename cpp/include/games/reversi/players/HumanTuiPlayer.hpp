#pragma once

#include "games/reversi/GameState.hpp"
#include "games/reversi/Piece.hpp"
#include "games/reversi/TilePos.hpp"
#include "games/reversi/players/AbstractPlayer.hpp"

#include <iostream>
#include <istream>
#include <optional>
#include <ostream>

namespace reversi {

/*
 * Plays moves typed in at a terminal.
 *
 * Before each move the board is printed, and the user is prompted until they enter a valid move
 * in "D3" notation. Closing the input stream raises a util::CleanException.
 */
class HumanTuiPlayer : public AbstractPlayer {
 public:
  HumanTuiPlayer(std::istream& in = std::cin, std::ostream& out = std::cout)
      : in_(in), out_(out) {}

  void start_game() override;
  void receive_move(Piece, const TilePos& pos, const GameState&) override;
  TilePos get_move(const GameState& state) override;
  void end_game(const GameState& state) override;

 protected:
  // Returns std::nullopt if the input is not a valid move for the player on turn.
  std::optional<TilePos> prompt_for_move(const GameState& state);

  std::istream& in_;
  std::ostream& out_;
  std::optional<TilePos> last_move_;
};

}  // namespace reversi
