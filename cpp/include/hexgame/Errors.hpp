#pragma once

#include "hexgame/Types.hpp"

#include <string>

namespace hexgame {

/*
 * Reasons a move is rejected. All of them are detected before the board is touched, so a rejected
 * move never partially applies.
 */
struct InvalidMove {
  enum Kind : int8_t { kOutOfBounds, kCellOccupied, kGameOver };

  static InvalidMove out_of_bounds(Coords coords) { return {kOutOfBounds, coords}; }
  static InvalidMove cell_occupied(Coords coords) { return {kCellOccupied, coords}; }
  static InvalidMove game_over() { return {kGameOver, {}}; }

  bool operator==(const InvalidMove&) const = default;
  std::string to_str() const;

  Kind kind;
  Coords coords;  // unused for kGameOver
};

/*
 * Reasons a board or game cannot be constructed from external data (a stone matrix or a saved
 * game). These never arise during play.
 */
struct InvalidBoard {
  enum Kind : int8_t {
    kSizeOutOfBounds,  // size, min_size, max_size
    kNotSquare,        // size, row_index
    kNoCurrentPlayer,
    kInvalidColor,     // value
    kMalformedData     // message
  };

  static InvalidBoard size_out_of_bounds(int size);
  static InvalidBoard not_square(int size, int row_index);
  static InvalidBoard no_current_player() { return {kNoCurrentPlayer}; }
  static InvalidBoard invalid_color(int64_t value);
  static InvalidBoard malformed_data(std::string message);

  bool operator==(const InvalidBoard&) const = default;
  std::string to_str() const;

  Kind kind;
  int size = 0;
  int min_size = 0;
  int max_size = 0;
  int row_index = 0;
  int64_t value = 0;
  std::string message;
};

}  // namespace hexgame
