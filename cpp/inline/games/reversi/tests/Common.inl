#include "games/reversi/tests/Common.hpp"

#include "games/reversi/IO.hpp"
#include "games/reversi/TilePos.hpp"
#include "util/Exception.hpp"

#include <sstream>
#include <vector>

namespace reversi {
namespace tests {

inline Grid make_grid(const std::string& board) {
  std::vector<std::string> lines;
  std::istringstream iss(board);
  std::string line;
  while (std::getline(iss, line)) {
    if (!line.empty()) lines.push_back(line);
  }
  if (lines.size() != kBoardDimension + 1) {
    throw util::Exception("make_grid(): expected {} lines, got {}", kBoardDimension + 1,
                          lines.size());
  }

  Grid grid;
  for (int row = 0; row < kBoardDimension; ++row) {
    const std::string& s = lines[row + 1];
    constexpr size_t kLineLength = 2 * kBoardDimension + 3;
    if (s.size() < kLineLength) {
      throw util::Exception("make_grid(): row {} is too short: \"{}\"", row + 1, s);
    }
    for (int col = 0; col < kBoardDimension; ++col) {
      char c = s[3 + 2 * col];
      TilePos pos = *TilePos::make(row, col);
      if (c == '*') {
        grid.set(pos, Piece::kBlack);
      } else if (c == '0') {
        grid.set(pos, Piece::kWhite);
      }
    }
  }
  return grid;
}

inline GameState make_state(const std::string& board, Piece to_move) {
  return GameState(make_grid(board), to_move);
}

inline std::string get_repr(const GameState& state) {
  std::ostringstream ss;
  IO::print_state(ss, state);

  std::istringstream iss(ss.str());
  std::string repr;
  std::string line;
  for (int i = 0; i < kBoardDimension + 1 && std::getline(iss, line); ++i) {
    repr += line;
    repr += '\n';
  }
  return repr;
}

}  // namespace tests
}  // namespace reversi
