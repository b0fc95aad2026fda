#include "games/reversi/GameRunner.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace reversi {

inline auto GameRunner::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("GameRunner options");

  return desc
    .template add_option<"num-games", 'G'>(po::value<int>(&num_games)->default_value(num_games),
                                           "num games to play")
    .template add_option<"move-delay-ms">(
      po::value<int>(&move_delay_ms)->default_value(move_delay_ms),
      "pause after each move, in milliseconds")
    .template add_flag<"show-board", "hide-board">(&show_board, "print the board after each move",
                                                   "do not print the board after each move");
}

}  // namespace reversi
