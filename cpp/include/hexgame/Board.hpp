#pragma once

#include "hexgame/Errors.hpp"
#include "hexgame/HexCells.hpp"
#include "hexgame/Types.hpp"

#include <expected>
#include <optional>
#include <vector>

namespace hexgame {

/*
 * A hex board of a fixed size, with stone placement and connectivity queries.
 *
 * Stones are never removed. Every placed stone is merged with its like-colored neighbors, edges
 * included, so that two positions share a set exactly when a like-colored path connects them.
 * Board does not know whose turn it is; see Game for that.
 */
class Board {
 public:
  // Throws util::CleanException if size is outside [kMinBoardSize, kMaxBoardSize].
  explicit Board(int size);

  // Rebuilds a board by replaying every stone of the matrix in row-major order.
  [[nodiscard]] static std::expected<Board, InvalidBoard> from_stone_matrix(
    const StoneMatrix& matrix);

  /*
   * Places a stone of the given color. Fails without touching the board if coords lies outside
   * the board or if the cell is already occupied.
   */
  [[nodiscard]] std::expected<void, InvalidMove> play(Coords coords, Color color);

  std::optional<Color> get_color(Coords coords) const { return cells_.get_color(coords); }
  int size() const { return cells_.size(); }

  bool is_in_same_set(const CoordsOrEdge& a, const CoordsOrEdge& b) const;

  // True if the two edges of color are connected, i.e. color has won.
  bool has_connected_edges(Color color) const;

  // Row-major.
  std::vector<Coords> get_empty_cells() const;

  /*
   * Returns the midpoints of the opponent bridges that the stone at coords intrudes on. See
   * AttackedBridges.hpp.
   */
  std::vector<Coords> find_attacked_bridges(Coords coords) const;

  StoneMatrix to_stone_matrix() const;

 private:
  HexCells cells_;
};

}  // namespace hexgame
