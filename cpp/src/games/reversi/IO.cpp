#include "games/reversi/IO.hpp"

#include "util/AnsiCodes.hpp"
#include "util/Rendering.hpp"

#include <algorithm>
#include <format>

namespace reversi {

namespace {

const char* piece_color(Piece piece) {
  return piece == Piece::kBlack ? ansi::kBlue("") : ansi::kWhite("");
}

const char* piece_symbol(Piece piece) {
  return ansi::kCircle(piece == Piece::kBlack ? "*" : "0");
}

}  // namespace

std::string IO::piece_to_str(Piece piece) {
  return std::format("{}{}{}", piece_color(piece), piece_symbol(piece), ansi::kReset(""));
}

void IO::print_state(std::ostream& os, const GameState& state, std::optional<TilePos> last_move,
                     const player_name_array_t* player_names) {
  TilePosList valid_moves;
  if (!state.is_terminal()) {
    valid_moves = state.valid_moves();
  }

  std::string out;
  bool text_mode = util::Rendering::mode() == util::Rendering::kText;
  if (text_mode && last_move) {
    out += std::format("{}x\n", std::string(2 * last_move->col() + 3, ' '));
  }
  out += "   A B C D E F G H\n";
  for (const Grid::Row& row : state.grid().rows()) {
    int blink_col = (last_move && last_move->row() == row.index) ? last_move->col() : -1;
    out += row_to_str(state, row, valid_moves, blink_col);
  }
  out += "\n";

  Scores scores = state.scores();
  out += "Score: Player\n";
  for (Piece piece : kAllPieces) {
    out += std::format("{:5}: {}", scores[piece], piece_to_str(piece));
    if (player_names) {
      out += std::format(" [{}]", (*player_names)[to_index(piece)]);
    }
    out += "\n";
  }

  os << out << std::endl;
}

std::string IO::row_to_str(const GameState& state, const Grid::Row& row,
                           const TilePosList& valid_moves, int blink_col) {
  char prefix = ' ';
  if (util::Rendering::mode() == util::Rendering::kText && blink_col >= 0) {
    prefix = 'x';
  }

  std::string out = std::format("{}{}", prefix, row.index + 1);
  for (int col = 0; col < kBoardDimension; ++col) {
    const Grid::Tile& tile = row.tiles[col];
    const char* blink = col == blink_col ? ansi::kBlink("") : "";
    if (tile) {
      out += std::format("|{}{}{}{}", piece_color(*tile), piece_symbol(*tile), blink,
                         ansi::kReset(""));
    } else {
      bool valid = std::ranges::any_of(valid_moves, [&](const TilePos& pos) {
        return pos.row() == row.index && pos.col() == col;
      });
      out += std::format("|{}", valid ? "." : " ");
    }
  }
  out += std::format("|{}\n", ansi::kReset(""));
  return out;
}

}  // namespace reversi
