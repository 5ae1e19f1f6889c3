#include "hexgame/HexCells.hpp"

#include "hexgame/Constants.hpp"
#include "util/Asserts.hpp"

namespace hexgame {

static_assert(kAllEdges.size() == size_t(kNumEdges));

HexCells::HexCells(int size) : size_(size), cells_(size * size + kNumEdges) {}

index_t HexCells::index_from_coords(Coords coords) const {
  // Off-board coords would index past cells_.
  RELEASE_ASSERT(coords.is_on_board_with_size(size_), "Coords ({}, {}) out of bounds for size {}",
                 coords.row, coords.column, size_);
  return coords.row * size_ + coords.column;
}

index_t HexCells::index_from_coords_or_edge(const CoordsOrEdge& coords_or_edge) const {
  if (const Coords* coords = std::get_if<Coords>(&coords_or_edge)) {
    return index_from_coords(*coords);
  }
  return index_from_edge(std::get<Edge>(coords_or_edge));
}

Coords HexCells::coords_from_index(index_t index) const {
  RELEASE_ASSERT(!is_edge(index), "Index {} cannot be converted to Coords", index);
  return Coords{index / size_, index % size_};
}

CoordsOrEdge HexCells::decode_index(index_t index) const {
  if (is_edge(index)) {
    return kAllEdges[index - num_cells()];
  }
  return coords_from_index(index);
}

void HexCells::set_edge_colors() {
  for (Edge edge : kAllEdges) {
    set_color(index_from_edge(edge), get_edge_color(edge));
  }
}

}  // namespace hexgame
