#pragma once

#include "hexgame/HexCells.hpp"
#include "hexgame/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>

namespace hexgame {

/*
 * The hex-neighbors of a cell, in clockwise order starting with the west neighbor:
 *
 *          NW  NE
 *        W   x   E
 *          SW  SE
 *
 * In terms of (row, column), that is:
 *
 *   W  = (r, c-1)     NW = (r-1, c)     NE = (r-1, c+1)
 *   E  = (r, c+1)     SE = (r+1, c)     SW = (r+1, c-1)
 *
 * Neighbors that fall off the board are replaced by the edge they fall onto: W by the left edge,
 * NW by the top edge, E by the right edge, SE by the bottom edge. NE and SW are dropped entirely
 * when they fall off the board, so a cell has 4, 5 or 6 neighbors.
 *
 * Neighbors is a lazy range: each neighbor is computed when the iterator reaches it, and the range
 * can be iterated any number of times. It holds a reference to the HexCells it was created from.
 */
class Neighbors {
 public:
  enum Direction : int8_t { kW, kNW, kNE, kE, kSE, kSW, kNumDirections };

  class Iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = index_t;
    using difference_type = std::ptrdiff_t;
    using pointer = const index_t*;
    using reference = index_t;

    Iterator() = default;
    Iterator(const Neighbors* neighbors, int direction);

    index_t operator*() const { return *neighbors_->get(Direction(direction_)); }
    Iterator& operator++();
    Iterator operator++(int);
    bool operator==(const Iterator& other) const { return direction_ == other.direction_; }

   private:
    void skip_missing();

    const Neighbors* neighbors_ = nullptr;
    int direction_ = kNumDirections;
  };

  Neighbors(const HexCells& cells, index_t index);

  Iterator begin() const { return Iterator(this, kW); }
  Iterator end() const { return Iterator(this, kNumDirections); }
  int size() const;

  // The neighbor in the given direction, or std::nullopt if there is none (only possible for NE
  // and SW).
  std::optional<index_t> get(Direction direction) const;

 private:
  const HexCells& cells_;
  const index_t index_;
  const index_t size_;
};

}  // namespace hexgame

#include "inline/hexgame/Neighbors.inl"
