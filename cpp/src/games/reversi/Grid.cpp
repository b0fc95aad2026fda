#include "games/reversi/Grid.hpp"

#include <algorithm>

namespace reversi {

bool Grid::is_full() const {
  return std::ranges::all_of(rows(), [](const Row& row) {
    return std::ranges::all_of(row.tiles, [](const Tile& tile) { return tile.has_value(); });
  });
}

int Grid::count(Piece piece) const {
  int n = 0;
  for (const Row& row : rows()) {
    n += std::ranges::count(row.tiles, Tile(piece));
  }
  return n;
}

}  // namespace reversi
