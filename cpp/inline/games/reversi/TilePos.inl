#include "games/reversi/TilePos.hpp"

#include "util/Asserts.hpp"

namespace reversi {

inline std::optional<TilePos> TilePos::make(int row, int col) {
  if (row < 0 || row >= kBoardDimension || col < 0 || col >= kBoardDimension) {
    return std::nullopt;
  }
  return TilePos(row, col);
}

inline TilePos TilePos::from_index(int index) {
  RELEASE_ASSERT(index >= 0 && index < kNumCells, "TilePos index out of range: {}", index);
  return TilePos(index / kBoardDimension, index % kBoardDimension);
}

inline std::optional<TilePos> TilePos::translate(const Direction& dir) const {
  return make(row_ + dir.drow, col_ + dir.dcol);
}

}  // namespace reversi
