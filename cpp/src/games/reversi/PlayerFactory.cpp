#include "games/reversi/PlayerFactory.hpp"

#include "games/reversi/players/HumanTuiPlayer.hpp"
#include "games/reversi/players/NegamaxPlayer.hpp"
#include "games/reversi/players/RandomPlayer.hpp"
#include "util/Exception.hpp"

#include <memory>

namespace reversi {

const std::vector<std::string>& PlayerFactory::player_types() {
  static const std::vector<std::string> types = {"human", "negamax", "random"};
  return types;
}

AbstractPlayer_sptr PlayerFactory::create(const std::string& type,
                                          const Negamax::Params& negamax_params) {
  AbstractPlayer_sptr player;
  if (type == "human") {
    player = std::make_shared<HumanTuiPlayer>();
  } else if (type == "negamax") {
    player = std::make_shared<NegamaxPlayer>(negamax_params);
  } else if (type == "random") {
    player = std::make_shared<RandomPlayer>();
  } else {
    throw util::CleanException("Unknown player type \"{}\" (expected human, negamax or random)",
                               type);
  }
  player->set_name(type);
  return player;
}

}  // namespace reversi
