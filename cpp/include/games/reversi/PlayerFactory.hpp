#pragma once

#include "games/reversi/Negamax.hpp"
#include "games/reversi/players/AbstractPlayer.hpp"

#include <string>
#include <vector>

namespace reversi {

/*
 * Creates players from the --black / --white cmdline values.
 *
 * Recognized types are "human", "negamax" and "random". Every negamax player shares the same
 * Negamax::Params.
 */
class PlayerFactory {
 public:
  static const std::vector<std::string>& player_types();

  // Throws util::CleanException for an unrecognized type.
  static AbstractPlayer_sptr create(const std::string& type, const Negamax::Params& negamax_params);
};

}  // namespace reversi
