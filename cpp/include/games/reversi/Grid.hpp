#pragma once

#include "games/reversi/Constants.hpp"
#include "games/reversi/Piece.hpp"
#include "games/reversi/TilePos.hpp"

#include <array>
#include <cstddef>
#include <iterator>
#include <optional>
#include <span>

namespace reversi {

/*
 * Fixed-size kBoardDimension x kBoardDimension board. Each tile is either empty or holds a single
 * Piece. The Grid exclusively owns its tile storage; it is a plain aggregate of small fixed-size
 * data, so copies are cheap and fully independent.
 *
 * Every read and write is range-checked against kBoardDimension.
 */
class Grid {
 public:
  using Tile = std::optional<Piece>;
  using RowTiles = std::span<const Tile, kBoardDimension>;

  // One row of the board, as exposed by rows().
  struct Row {
    int index;
    RowTiles tiles;
  };

  /*
   * Read-only row-major traversal over the board, yielding (row-index, tiles) pairs.
   *
   * Usage:
   *
   * for (const Grid::Row& row : grid.rows()) {
   *   for (const Grid::Tile& tile : row.tiles) { ... }
   * }
   *
   * Each call to rows() returns a fresh, finite traversal. It is invalidated by destruction of the
   * Grid.
   */
  class RowRange {
   public:
    class Iterator {
     public:
      using iterator_category = std::forward_iterator_tag;
      using value_type = Row;
      using difference_type = std::ptrdiff_t;
      using pointer = void;
      using reference = Row;

      Iterator() = default;
      Iterator(const Grid* grid, int row) : grid_(grid), row_(row) {}

      Row operator*() const;
      Iterator& operator++() {
        ++row_;
        return *this;
      }
      Iterator operator++(int) {
        Iterator tmp = *this;
        ++row_;
        return tmp;
      }
      bool operator==(const Iterator&) const = default;

     private:
      const Grid* grid_ = nullptr;
      int row_ = 0;
    };

    explicit RowRange(const Grid* grid) : grid_(grid) {}
    Iterator begin() const { return Iterator(grid_, 0); }
    Iterator end() const { return Iterator(grid_, kBoardDimension); }

   private:
    const Grid* grid_;
  };

  Tile get(const TilePos& pos) const;
  void set(const TilePos& pos, Piece piece);
  void clear(const TilePos& pos);

  // True iff every tile is occupied.
  bool is_full() const;

  // Number of tiles occupied by the given piece.
  int count(Piece piece) const;

  RowRange rows() const { return RowRange(this); }

  bool operator==(const Grid&) const = default;

 private:
  static void validate(const TilePos& pos);

  std::array<std::array<Tile, kBoardDimension>, kBoardDimension> tiles_{};
};

}  // namespace reversi

#include "inline/games/reversi/Grid.inl"
