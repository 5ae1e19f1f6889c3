#pragma once

#include "hexgame/Types.hpp"
#include "hexgame/UnionFind.hpp"

#include <optional>
#include <vector>

namespace hexgame {

/*
 * Flat storage of the cells of a hex board, plus one virtual cell per edge.
 *
 * Layout for a board of size s:
 *
 *   [0, s*s)   normal cells, index = row*s + column
 *   s*s + 0    left edge
 *   s*s + 1    top edge
 *   s*s + 2    right edge
 *   s*s + 3    bottom edge
 *
 * Each slot stores a color and a union-find parent, so HexCells doubles as the connectivity
 * structure of the board. HexCells does not enforce any game rules; see Board for that.
 */
class HexCells : public UnionFind<HexCells, index_t> {
 public:
  explicit HexCells(int size);

  int size() const { return size_; }
  index_t num_cells() const { return size_ * size_; }

  index_t index_from_coords(Coords coords) const;
  index_t index_from_edge(Edge edge) const { return num_cells() + edge; }
  index_t index_from_coords_or_edge(const CoordsOrEdge& coords_or_edge) const;

  // Requires a normal-cell index; edges have no coordinates.
  Coords coords_from_index(index_t index) const;
  CoordsOrEdge decode_index(index_t index) const;
  bool is_edge(index_t index) const { return index >= num_cells(); }

  std::optional<Color> get_color(index_t index) const { return cells_[index].color; }
  std::optional<Color> get_color(Coords coords) const {
    return get_color(index_from_coords(coords));
  }
  void set_color(index_t index, Color color) { cells_[index].color = color; }
  void set_color(Coords coords, Color color) { set_color(index_from_coords(coords), color); }

  // Colors the four edge cells: top/bottom black, left/right white.
  void set_edge_colors();

  std::optional<index_t> get_parent(index_t index) const { return cells_[index].parent; }
  void set_parent(index_t index, index_t parent) const { cells_[index].parent = parent; }

 private:
  struct Cell {
    std::optional<Color> color;
    mutable std::optional<index_t> parent;
  };

  int size_;
  std::vector<Cell> cells_;
};

}  // namespace hexgame
