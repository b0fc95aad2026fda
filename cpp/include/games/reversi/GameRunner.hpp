#pragma once

#include "games/reversi/GameState.hpp"
#include "games/reversi/Piece.hpp"
#include "games/reversi/players/AbstractPlayer.hpp"

#include <array>
#include <optional>

namespace reversi {

/*
 * Drives games between two players.
 *
 * The runner asks the player on turn for a move, applies it, and echoes the resulting state to both
 * players, until the state is terminal. Passes need no special handling: GameState::apply_move()
 * already leaves the mover on turn when the opponent has no reply.
 */
class GameRunner {
 public:
  struct Params {
    auto make_options_description();

    int num_games = 1;
    int move_delay_ms = 0;
    bool show_board = false;
  };

  struct Result {
    Scores scores;
    std::optional<Piece> winner;  // std::nullopt on a draw
    int num_moves = 0;
  };

  struct SeriesResult {
    std::array<int, kNumPlayers> wins = {};
    int draws = 0;

    int num_games() const { return wins[0] + wins[1] + draws; }
  };

  GameRunner(const Params& params) : params_(params) {}

  /*
   * Plays a single game from the starting position. A player returning an illegal move is a bug in
   * that player, and is rethrown as util::Exception.
   */
  Result run(AbstractPlayer& black, AbstractPlayer& white);

  // Plays params.num_games games, with the same seat assignment, and tallies the results.
  SeriesResult run_series(AbstractPlayer& black, AbstractPlayer& white);

 private:
  const Params params_;
};

}  // namespace reversi

#include "inline/games/reversi/GameRunner.inl"
