#include "games/reversi/GameRunner.hpp"
#include "games/reversi/Negamax.hpp"
#include "games/reversi/PlayerFactory.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <string>

struct Args {
  std::string black = "human";
  std::string white = "negamax";

  auto make_options_description() {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    po2::options_description desc("Program options");

    return desc
      .template add_option<"black">(po::value<std::string>(&black)->default_value(black),
                                    "black player type (human, negamax, random)")
      .template add_option<"white">(po::value<std::string>(&white)->default_value(white),
                                    "white player type (human, negamax, random)");
  }
};

int main(int ac, char* av[]) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    Args args;
    util::Logging::Params log_params;
    util::Random::Params random_params;
    reversi::Negamax::Params negamax_params;
    reversi::GameRunner::Params runner_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                  .template add_option<"help-full">("help (all options)")
                  .add(args.make_options_description())
                  .add(negamax_params.make_options_description())
                  .add(runner_params.make_options_description())
                  .add(log_params.make_options_description())
                  .add(random_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);

    bool help_full = vm.count("help-full");
    bool help = vm.count("help");
    if (help || help_full) {
      po2::Settings::help_full = help_full;
      std::cout << desc << std::endl;
      return 0;
    }

    util::Logging::init(log_params);
    util::Random::init(random_params);

    reversi::AbstractPlayer_sptr black = reversi::PlayerFactory::create(args.black, negamax_params);
    reversi::AbstractPlayer_sptr white = reversi::PlayerFactory::create(args.white, negamax_params);

    LOG_INFO("Starting {} game(s): black={} white={}", runner_params.num_games, args.black,
             args.white);

    reversi::GameRunner runner(runner_params);
    reversi::GameRunner::SeriesResult series = runner.run_series(*black, *white);

    std::cout << "Black wins: " << series.wins[reversi::to_index(reversi::Piece::kBlack)]
              << std::endl;
    std::cout << "White wins: " << series.wins[reversi::to_index(reversi::Piece::kWhite)]
              << std::endl;
    std::cout << "Draws: " << series.draws << std::endl;
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
