#include "hexgame/IO.hpp"

#include "hexgame/Board.hpp"
#include "util/StringUtil.hpp"

#include <fmt/format.h>

#include <cctype>
#include <cstdint>
#include <sstream>
#include <vector>

namespace hexgame {

namespace {

constexpr int kNumColumnLetters = 26;

}  // namespace

std::string IO::coords_to_str(Coords coords) {
  // Coords off any board, e.g. from a rejected move, have no letter form.
  if (coords.row < 0 || coords.column < 0 || coords.column >= kNumColumnLetters) {
    return fmt::format("({}, {})", coords.row, coords.column);
  }
  return fmt::format("{}{}", column_to_char(coords.column), int64_t(coords.row) + 1);
}

std::optional<Coords> IO::parse_coords(const std::string& str) {
  if (str.size() < 2 || str[0] < 'a' || str[0] > 'z') {
    return std::nullopt;
  }
  int column = str[0] - 'a';

  std::optional<int> row = util::parse_int(str.substr(1));
  if (!row || *row < 1) {
    return std::nullopt;
  }
  return Coords{*row - 1, column};
}

std::optional<Coords> IO::parse_row_column(const std::string& str) {
  std::vector<std::string> tokens = util::split(str, ",");
  if (tokens.size() != 2) {
    return std::nullopt;
  }
  std::optional<int> row = util::parse_int(util::strip(tokens[0]));
  std::optional<int> column = util::parse_int(util::strip(tokens[1]));
  if (!row || !column) {
    return std::nullopt;
  }
  return Coords{*row, *column};
}

void IO::print_board(std::ostream& os, const Board& board) {
  print_column_labels(os, board.size(), 0);
  for (int row = 0; row < board.size(); ++row) {
    print_row(os, board, row);
  }
  print_column_labels(os, board.size(), board.size() + 1);
}

std::string IO::board_to_str(const Board& board) {
  std::ostringstream ss;
  print_board(ss, board);
  return ss.str();
}

void IO::print_column_labels(std::ostream& os, int board_size, int indent) {
  os << util::make_whitespace(indent);
  for (int column = 0; column < board_size; ++column) {
    os << ' ' << column_to_char(column) << ' ';
  }
  os << '\n';
}

void IO::print_row(std::ostream& os, const Board& board, int row) {
  os << util::make_whitespace(row) << row + 1 << '\\';
  for (int column = 0; column < board.size(); ++column) {
    if (column > 0) {
      os << "  ";
    }
    os << color_to_glyph(board.get_color(Coords{row, column}));
  }
  os << '\\' << row + 1 << '\n';
}

const char* IO::color_to_glyph(std::optional<Color> color) {
  if (!color) return ".";
  return *color == kBlack ? "●" : "○";
}

}  // namespace hexgame
