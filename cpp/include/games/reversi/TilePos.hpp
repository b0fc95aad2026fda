#pragma once

#include "games/reversi/BasicTypes.hpp"
#include "games/reversi/Constants.hpp"
#include "games/reversi/Direction.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reversi {

class TilePos;
using TilePosList = std::vector<TilePos>;

/*
 * A coordinate on the board. A TilePos is always in bounds: the only ways to obtain one are the
 * factory functions below, which reject out-of-range input.
 *
 * Equality and ordering are structural, by row then col.
 */
class TilePos {
 public:
  // Returns std::nullopt unless 0 <= row, col < kBoardDimension.
  static std::optional<TilePos> make(int row, int col);

  // Parses "D3" style notation (column letter A-H in either case, then row number 1-8). Returns
  // std::nullopt on malformed or out-of-range input.
  static std::optional<TilePos> from_str(std::string_view s);

  // Inverse of index(). Throws util::ReleaseAssertionError if index is not in [0, kNumCells).
  static TilePos from_index(int index);

  row_t row() const { return row_; }
  column_t col() const { return col_; }
  int index() const { return row_ * kBoardDimension + col_; }

  // The adjacent position in the given direction, or std::nullopt if it falls off the board.
  std::optional<TilePos> translate(const Direction& dir) const;

  // The up-to-8 in-bounds adjacent positions, in kDirections order.
  TilePosList neighbors() const;

  std::string to_str() const;

  auto operator<=>(const TilePos&) const = default;
  bool operator==(const TilePos&) const = default;

 private:
  constexpr TilePos(row_t row, column_t col) : row_(row), col_(col) {}

  row_t row_;
  column_t col_;
};

}  // namespace reversi

namespace std {

template <>
struct hash<reversi::TilePos> {
  size_t operator()(const reversi::TilePos& pos) const { return pos.index(); }
};

}  // namespace std

#include "inline/games/reversi/TilePos.inl"
