#pragma once

#include "games/reversi/Constants.hpp"

#include <array>
#include <cstdint>

namespace reversi {

enum class Piece : int8_t { kBlack = 0, kWhite = 1 };

constexpr Piece kStartingPiece = Piece::kBlack;
constexpr std::array<Piece, kNumPlayers> kAllPieces = {Piece::kBlack, Piece::kWhite};

// Involutive: opposite(opposite(p)) == p.
constexpr Piece opposite(Piece p) { return p == Piece::kBlack ? Piece::kWhite : Piece::kBlack; }

// 0 for black, 1 for white. Used to index per-player arrays.
constexpr int to_index(Piece p) { return static_cast<int>(p); }

constexpr const char* piece_name(Piece p) { return p == Piece::kBlack ? "black" : "white"; }

}  // namespace reversi
