#pragma once

#include "games/reversi/BasicTypes.hpp"

/*
 * Board coordinates:
 *
 *    A  B  C  D  E  F  G  H      <- col 0..7
 * 1
 * 2
 * ...                            <- row 0..7 (row 0 is printed as "1")
 * 8
 *
 * A TilePos (row, col) is printed as <column letter><row number>, so (2, 3) is "D3". Cell indices
 * are row-major: index = row * kBoardDimension + col.
 */
namespace reversi {

constexpr int kNumPlayers = 2;
constexpr int kBoardDimension = 8;
constexpr int kNumCells = kBoardDimension * kBoardDimension;
constexpr int kNumStartingPieces = 4;
constexpr int kNumDirections = 8;

// Starting layout: the four center tiles in alternating colors.
constexpr int kStartingWhiteRow1 = 3;
constexpr int kStartingWhiteCol1 = 3;
constexpr int kStartingWhiteRow2 = 4;
constexpr int kStartingWhiteCol2 = 4;
constexpr int kStartingBlackRow1 = 3;
constexpr int kStartingBlackCol1 = 4;
constexpr int kStartingBlackRow2 = 4;
constexpr int kStartingBlackCol2 = 3;

// Positional evaluation weights.
constexpr int kCornerBonus = 4;
constexpr int kSideBonus = 2;

constexpr int kDefaultSearchDepth = 4;

// Strictly larger in magnitude than any evaluation.
constexpr int kInfiniteScore = 1 << 20;

}  // namespace reversi
