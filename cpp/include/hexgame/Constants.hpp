#pragma once

namespace hexgame {

// Neighbor enumeration assumes at least a 2x2 grid.
constexpr int kMinBoardSize = 2;

// Larger boards would work, but 19 is the largest board the index type is sized for in practice.
constexpr int kMaxBoardSize = 19;

constexpr int kDefaultBoardSize = 11;

// Number of virtual edge cells appended after the normal cells.
constexpr int kNumEdges = 4;

// Maximum number of hex-neighbors of a single cell.
constexpr int kMaxNumNeighbors = 6;

}  // namespace hexgame
