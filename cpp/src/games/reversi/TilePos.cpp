#include "games/reversi/TilePos.hpp"

#include <cctype>
#include <charconv>
#include <system_error>

namespace reversi {

std::optional<TilePos> TilePos::from_str(std::string_view s) {
  if (s.size() < 2) {
    return std::nullopt;
  }

  int col = std::toupper(static_cast<unsigned char>(s[0])) - 'A';

  int row_number = 0;
  const char* first = s.data() + 1;
  const char* last = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(first, last, row_number);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return make(row_number - 1, col);
}

TilePosList TilePos::neighbors() const {
  TilePosList out;
  out.reserve(kNumDirections);
  for (const Direction& dir : kDirections) {
    std::optional<TilePos> pos = translate(dir);
    if (pos) {
      out.push_back(*pos);
    }
  }
  return out;
}

std::string TilePos::to_str() const {
  std::string s;
  s += static_cast<char>('A' + col_);
  s += std::to_string(row_ + 1);
  return s;
}

}  // namespace reversi
