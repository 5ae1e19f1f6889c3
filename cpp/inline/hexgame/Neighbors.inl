#include "hexgame/Neighbors.hpp"

namespace hexgame {

inline Neighbors::Iterator::Iterator(const Neighbors* neighbors, int direction)
    : neighbors_(neighbors), direction_(direction) {
  skip_missing();
}

inline Neighbors::Iterator& Neighbors::Iterator::operator++() {
  ++direction_;
  skip_missing();
  return *this;
}

inline Neighbors::Iterator Neighbors::Iterator::operator++(int) {
  Iterator tmp = *this;
  ++(*this);
  return tmp;
}

inline void Neighbors::Iterator::skip_missing() {
  while (direction_ < kNumDirections && !neighbors_->get(Direction(direction_))) {
    ++direction_;
  }
}

inline Neighbors::Neighbors(const HexCells& cells, index_t index)
    : cells_(cells), index_(index), size_(cells.size()) {}

inline int Neighbors::size() const {
  int n = 0;
  for (int d = 0; d < kNumDirections; ++d) {
    n += get(Direction(d)).has_value();
  }
  return n;
}

inline std::optional<index_t> Neighbors::get(Direction direction) const {
  const int column = index_ % size_;
  const bool top_row = index_ < size_;
  const bool bottom_row = index_ >= size_ * (size_ - 1);
  const bool left_column = column == 0;
  const bool right_column = column == size_ - 1;

  switch (direction) {
    case kW:
      return left_column ? cells_.index_from_edge(kLeft) : index_ - 1;
    case kNW:
      return top_row ? cells_.index_from_edge(kTop) : index_ - size_;
    case kNE:
      if (top_row || right_column) return std::nullopt;
      return index_ - size_ + 1;
    case kE:
      return right_column ? cells_.index_from_edge(kRight) : index_ + 1;
    case kSE:
      return bottom_row ? cells_.index_from_edge(kBottom) : index_ + size_;
    case kSW:
      if (bottom_row || left_column) return std::nullopt;
      return index_ + size_ - 1;
    default:
      return std::nullopt;
  }
}

}  // namespace hexgame
