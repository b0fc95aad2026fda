#include "games/reversi/players/HumanTuiPlayer.hpp"

#include "games/reversi/IO.hpp"
#include "util/Exception.hpp"

#include <string>

namespace reversi {

void HumanTuiPlayer::start_game() { last_move_.reset(); }

void HumanTuiPlayer::receive_move(Piece, const TilePos& pos, const GameState&) {
  last_move_ = pos;
}

TilePos HumanTuiPlayer::get_move(const GameState& state) {
  IO::print_state(out_, state, last_move_);
  out_ << "You are " << IO::piece_to_str(get_my_piece()) << std::endl;

  while (true) {
    std::optional<TilePos> move = prompt_for_move(state);
    if (move) return *move;
    out_ << "Invalid input!" << std::endl;
  }
}

void HumanTuiPlayer::end_game(const GameState& state) {
  IO::print_state(out_, state, last_move_);

  std::optional<Piece> winner = state.winner();
  if (!winner) {
    out_ << "Draw!" << std::endl;
  } else if (*winner == get_my_piece()) {
    out_ << "Congratulations, you win!" << std::endl;
  } else {
    out_ << "You lose!" << std::endl;
  }
}

std::optional<TilePos> HumanTuiPlayer::prompt_for_move(const GameState& state) {
  out_ << "Enter move [A1-H8]: ";
  out_.flush();

  std::string input;
  if (!std::getline(in_, input)) {
    throw util::CleanException("End of input while waiting for a move");
  }

  std::optional<TilePos> pos = TilePos::from_str(input);
  if (!pos || !state.is_valid_move(*pos, state.current_player())) {
    return std::nullopt;
  }
  return pos;
}

}  // namespace reversi
