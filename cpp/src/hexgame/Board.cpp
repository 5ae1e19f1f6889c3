#include "hexgame/Board.hpp"

#include "hexgame/AttackedBridges.hpp"
#include "hexgame/Constants.hpp"
#include "hexgame/Neighbors.hpp"
#include "util/Asserts.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

namespace hexgame {

namespace {

bool is_valid_size(int size) { return kMinBoardSize <= size && size <= kMaxBoardSize; }

int validate_size(int size) {
  if (!is_valid_size(size)) {
    throw util::CleanException("Board size must be between {} and {}. Found {}", kMinBoardSize,
                               kMaxBoardSize, size);
  }
  return size;
}

}  // namespace

Board::Board(int size) : cells_(validate_size(size)) { cells_.set_edge_colors(); }

std::expected<Board, InvalidBoard> Board::from_stone_matrix(const StoneMatrix& matrix) {
  const int size = matrix.size();
  if (!is_valid_size(size)) {
    return std::unexpected(InvalidBoard::size_out_of_bounds(size));
  }
  for (int row = 0; row < size; ++row) {
    if (int(matrix[row].size()) != size) {
      return std::unexpected(InvalidBoard::not_square(size, row));
    }
  }

  Board board(size);
  int num_stones = 0;
  for (int row = 0; row < size; ++row) {
    for (int column = 0; column < size; ++column) {
      std::optional<Color> color = matrix[row][column];
      if (!color) continue;

      // cannot fail: the matrix is square and every cell is visited once
      bool played = board.play(Coords{row, column}, *color).has_value();
      RELEASE_ASSERT(played, "Replay failed at ({}, {})", row, column);
      ++num_stones;
    }
  }
  LOG_DEBUG("Loaded board of size {} with {} stones", size, num_stones);
  return board;
}

std::expected<void, InvalidMove> Board::play(Coords coords, Color color) {
  if (!coords.is_on_board_with_size(size())) {
    return std::unexpected(InvalidMove::out_of_bounds(coords));
  }

  const index_t index = cells_.index_from_coords(coords);
  if (cells_.get_color(index)) {
    return std::unexpected(InvalidMove::cell_occupied(coords));
  }
  cells_.set_color(index, color);

  // Consecutive neighbors either touch each other or hang off the same edge, so after a merge the
  // next neighbor is either of another color or already in the same set.
  bool skip_next = false;
  for (index_t neighbor : Neighbors(cells_, index)) {
    if (skip_next) {
      skip_next = false;
      continue;
    }
    if (cells_.get_color(neighbor) == color) {
      cells_.merge(index, neighbor);
      skip_next = true;
    }
  }
  return {};
}

bool Board::is_in_same_set(const CoordsOrEdge& a, const CoordsOrEdge& b) const {
  return cells_.is_in_same_set(cells_.index_from_coords_or_edge(a),
                               cells_.index_from_coords_or_edge(b));
}

bool Board::has_connected_edges(Color color) const {
  auto edges = get_edges_of_color(color);
  return is_in_same_set(edges[0], edges[1]);
}

std::vector<Coords> Board::get_empty_cells() const {
  std::vector<Coords> empty_cells;
  for (index_t index = 0; index < cells_.num_cells(); ++index) {
    if (!cells_.get_color(index)) {
      empty_cells.push_back(cells_.coords_from_index(index));
    }
  }
  return empty_cells;
}

std::vector<Coords> Board::find_attacked_bridges(Coords coords) const {
  return hexgame::find_attacked_bridges(cells_, coords);
}

StoneMatrix Board::to_stone_matrix() const {
  StoneMatrix matrix(size(), std::vector<std::optional<Color>>(size()));
  for (int row = 0; row < size(); ++row) {
    for (int column = 0; column < size(); ++column) {
      matrix[row][column] = get_color(Coords{row, column});
    }
  }
  return matrix;
}

}  // namespace hexgame
