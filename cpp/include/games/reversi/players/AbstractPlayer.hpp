#pragma once

#include "games/reversi/GameState.hpp"
#include "games/reversi/Piece.hpp"
#include "games/reversi/TilePos.hpp"

#include <memory>
#include <string>

namespace reversi {

/*
 * Base class for all players.
 *
 * There are 4 virtual functions to override:
 *
 * - start_game()
 * - receive_move()
 * - get_move()
 * - end_game()
 *
 * start_game() and end_game() are called when a game starts or ends. A single player might play
 * multiple games in succession, so you should override these if there is state that you want to
 * clear between games.
 *
 * receive_move() is called after every move, by either player, with the resulting state. Note that
 * you get this callback even after your own move, as a sort of "echo".
 *
 * get_move() is called when it is your turn. The returned position must be one of
 * state.valid_moves().
 */
class AbstractPlayer {
 public:
  virtual ~AbstractPlayer() = default;

  void set_name(const std::string& name) { name_ = name; }
  const std::string& get_name() const { return name_; }
  Piece get_my_piece() const { return my_piece_; }

  void init_game(Piece my_piece) {
    my_piece_ = my_piece;
    start_game();
  }

  virtual void start_game() {}
  virtual void receive_move(Piece, const TilePos&, const GameState&) {}
  virtual TilePos get_move(const GameState& state) = 0;
  virtual void end_game(const GameState&) {}

 private:
  std::string name_;
  Piece my_piece_ = Piece::kBlack;
};

using AbstractPlayer_sptr = std::shared_ptr<AbstractPlayer>;

}  // namespace reversi
