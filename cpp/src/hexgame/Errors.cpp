#include "hexgame/Errors.hpp"

#include "hexgame/Constants.hpp"
#include "hexgame/IO.hpp"
#include "util/Exception.hpp"

#include <fmt/format.h>

#include <utility>

namespace hexgame {

std::string InvalidMove::to_str() const {
  switch (kind) {
    case kOutOfBounds:
      return fmt::format("Coordinates {} are out of bounds", IO::coords_to_str(coords));
    case kCellOccupied:
      return fmt::format("Cell {} is already occupied", IO::coords_to_str(coords));
    case kGameOver:
      return "Game has ended";
  }
  throw util::Exception("Unexpected InvalidMove kind: {}", int(kind));
}

InvalidBoard InvalidBoard::size_out_of_bounds(int size) {
  InvalidBoard error{kSizeOutOfBounds};
  error.size = size;
  error.min_size = kMinBoardSize;
  error.max_size = kMaxBoardSize;
  return error;
}

InvalidBoard InvalidBoard::not_square(int size, int row_index) {
  InvalidBoard error{kNotSquare};
  error.size = size;
  error.row_index = row_index;
  return error;
}

InvalidBoard InvalidBoard::invalid_color(int64_t value) {
  InvalidBoard error{kInvalidColor};
  error.value = value;
  return error;
}

InvalidBoard InvalidBoard::malformed_data(std::string message) {
  InvalidBoard error{kMalformedData};
  error.message = std::move(message);
  return error;
}

std::string InvalidBoard::to_str() const {
  switch (kind) {
    case kSizeOutOfBounds:
      return fmt::format("Board size must be between {} and {}. Found {}", min_size, max_size,
                         size);
    case kNotSquare:
      return fmt::format("Length of row {} does not match board size {}", row_index, size);
    case kNoCurrentPlayer:
      return "Current player is missing";
    case kInvalidColor:
      return fmt::format("Invalid color {}", value);
    case kMalformedData:
      return message;
  }
  throw util::Exception("Unexpected InvalidBoard kind: {}", int(kind));
}

}  // namespace hexgame
