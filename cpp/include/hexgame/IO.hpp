#pragma once

#include "hexgame/Types.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace hexgame {

class Board;

/*
 * Human-readable text formats.
 *
 * Cells are written as a column letter followed by a 1-based row number: Coords{0, 0} is "a1" and
 * Coords{12, 5} is "f13". Coords with a negative component or a column past 'z' are written as
 * "(row, column)".
 */
struct IO {
  static std::string coords_to_str(Coords coords);

  // Accepts a lower-case column letter followed by a positive row number ("c4"). Returns
  // std::nullopt for anything else. Does not check the result against a board size.
  static std::optional<Coords> parse_coords(const std::string& str);

  // Accepts zero-based "row,column" ("2,3"), with optional surrounding whitespace.
  static std::optional<Coords> parse_row_column(const std::string& str);

  static char column_to_char(int column) { return 'a' + column; }

  /*
   * Example output for a board of size 5:
   *
   *  a  b  c  d  e
   * 1\.  .  .  .  .\1
   *  2\.  ●  .  ○  .\2
   *   3\.  .  ●  .  .\3
   *    4\.  .  .  ○  .\4
   *     5\.  .  .  .  .\5
   *        a  b  c  d  e
   */
  static void print_board(std::ostream&, const Board&);
  static std::string board_to_str(const Board&);

 private:
  static void print_column_labels(std::ostream&, int board_size, int indent);
  static void print_row(std::ostream&, const Board&, int row);
  static const char* color_to_glyph(std::optional<Color> color);
};

}  // namespace hexgame
