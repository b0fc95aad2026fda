#include "games/reversi/Grid.hpp"

#include "util/Asserts.hpp"

namespace reversi {

inline Grid::Row Grid::RowRange::Iterator::operator*() const {
  RELEASE_ASSERT(row_ >= 0 && row_ < kBoardDimension, "Grid row out of range: {}", row_);
  return Row{row_, RowTiles(grid_->tiles_[row_])};
}

inline Grid::Tile Grid::get(const TilePos& pos) const {
  validate(pos);
  return tiles_[pos.row()][pos.col()];
}

inline void Grid::set(const TilePos& pos, Piece piece) {
  validate(pos);
  tiles_[pos.row()][pos.col()] = piece;
}

inline void Grid::clear(const TilePos& pos) {
  validate(pos);
  tiles_[pos.row()][pos.col()].reset();
}

inline void Grid::validate(const TilePos& pos) {
  RELEASE_ASSERT(pos.row() >= 0 && pos.row() < kBoardDimension && pos.col() >= 0 &&
                   pos.col() < kBoardDimension,
                 "Grid position out of range: ({}, {})", pos.row(), pos.col());
}

}  // namespace reversi
