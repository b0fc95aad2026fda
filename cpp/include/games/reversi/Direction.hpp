#pragma once

#include "games/reversi/Constants.hpp"

#include <array>
#include <cstdint>

namespace reversi {

/*
 * One of the 8 compass directions, as a (drow, dcol) step.
 */
struct Direction {
  int8_t drow;
  int8_t dcol;

  constexpr bool operator==(const Direction&) const = default;
};

// Row-major enumeration order. Every traversal over directions uses this order, which makes
// neighbor lists and flip lists reproducible.
inline constexpr std::array<Direction, kNumDirections> kDirections = {{
  {-1, -1}, {-1, 0}, {-1, 1},
  {0, -1},           {0, 1},
  {1, -1},  {1, 0},  {1, 1},
}};

}  // namespace reversi
