#include "games/reversi/Negamax.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace reversi {

inline auto Negamax::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Negamax options");

  return desc
    .template add_option<"depth", 'd'>(po::value<int>(&depth)->default_value(depth),
                                       "search depth, in plies")
    .template add_option<"evaluator">(po::value<std::string>(&evaluator)->default_value(evaluator),
                                      "static evaluation: piece-count or positional")
    .template add_flag<"alpha-beta", "no-alpha-beta">(&alpha_beta, "enable alpha-beta pruning",
                                                      "disable alpha-beta pruning");
}

}  // namespace reversi
