#include "games/reversi/GameRunner.hpp"

#include "games/reversi/IO.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <chrono>
#include <iostream>
#include <thread>

namespace reversi {

GameRunner::Result GameRunner::run(AbstractPlayer& black, AbstractPlayer& white) {
  std::array<AbstractPlayer*, kNumPlayers> players = {&black, &white};
  IO::player_name_array_t names = {black.get_name(), white.get_name()};

  black.init_game(Piece::kBlack);
  white.init_game(Piece::kWhite);

  GameState state;
  Result result;
  while (!state.is_terminal()) {
    Piece mover = state.current_player();
    AbstractPlayer* player = players[to_index(mover)];
    TilePos move = player->get_move(state);

    try {
      state.apply_move(move, mover);
    } catch (const InvalidMoveError& e) {
      throw util::Exception("{} player {} returned an illegal move {}: {}", piece_name(mover),
                            player->get_name(), move.to_str(), e.what());
    }
    result.num_moves++;
    LOG_INFO("move {}: {} {}", result.num_moves, piece_name(mover), move.to_str());

    for (AbstractPlayer* p : players) {
      p->receive_move(mover, move, state);
    }

    if (params_.show_board) {
      IO::print_state(std::cout, state, move, &names);
    }
    if (params_.move_delay_ms > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(params_.move_delay_ms));
    }
  }

  for (AbstractPlayer* p : players) {
    p->end_game(state);
  }

  result.scores = state.scores();
  result.winner = state.winner();
  LOG_INFO("Game over after {} moves: black={} white={} winner={}", result.num_moves,
           result.scores[Piece::kBlack], result.scores[Piece::kWhite],
           result.winner ? piece_name(*result.winner) : "draw");
  return result;
}

GameRunner::SeriesResult GameRunner::run_series(AbstractPlayer& black, AbstractPlayer& white) {
  SeriesResult series;
  for (int g = 0; g < params_.num_games; ++g) {
    Result result = run(black, white);
    if (result.winner) {
      series.wins[to_index(*result.winner)]++;
    } else {
      series.draws++;
    }
  }

  LOG_INFO("Series of {} games: black wins={} white wins={} draws={}", series.num_games(),
           series.wins[to_index(Piece::kBlack)], series.wins[to_index(Piece::kWhite)],
           series.draws);
  return series;
}

}  // namespace reversi
