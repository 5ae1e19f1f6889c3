#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace hexgame {

/*
 * Internal index into HexCells. Normal cells occupy [0, size*size) with index = row*size+column;
 * the four edges follow in the order Left, Top, Right, Bottom. Indices are never exposed by the
 * Board/Game API; Coords and Edge are exposed instead.
 */
using index_t = uint16_t;

/*
 * Black connects Top to Bottom. White connects Left to Right. Black moves first.
 */
enum Color : int8_t { kBlack, kWhite };

constexpr Color opponent_color(Color color) { return color == kBlack ? kWhite : kBlack; }

const char* color_to_str(Color color);

/*
 * The four board edges, in the order their virtual cells are laid out after the normal cells.
 */
enum Edge : int8_t { kLeft, kTop, kRight, kBottom };

constexpr std::array<Edge, 4> kAllEdges = {kLeft, kTop, kRight, kBottom};

// Returns the two edges that the given color tries to connect.
constexpr std::array<Edge, 2> get_edges_of_color(Color color) {
  return color == kBlack ? std::array<Edge, 2>{kTop, kBottom} : std::array<Edge, 2>{kLeft, kRight};
}

constexpr Color get_edge_color(Edge edge) {
  return (edge == kTop || edge == kBottom) ? kBlack : kWhite;
}

struct Coords {
  auto operator<=>(const Coords&) const = default;

  bool is_on_board_with_size(int size) const {
    return 0 <= row && row < size && 0 <= column && column < size;
  }

  int row;
  int column;
};

// Either a cell of the board or an edge. Used where a value may be both, e.g. neighbor lists.
using CoordsOrEdge = std::variant<Coords, Edge>;

// Row-major matrix of cell contents. std::nullopt marks an empty cell.
using StoneMatrix = std::vector<std::vector<std::optional<Color>>>;

}  // namespace hexgame

#include "inline/hexgame/Types.inl"
