#pragma once

#include "hexgame/HexCells.hpp"
#include "hexgame/Types.hpp"

#include <vector>

namespace hexgame {

/*
 * A bridge is a pair of same-colored stones (or a stone and its own edge) with two shared empty
 * neighbors. The owner can always connect them by answering in whichever shared cell remains.
 *
 * When a stone is placed on one of the two shared cells, the bridge is "attacked" and the owner
 * should respond on the other one. Seen from the attacking stone, an attacked bridge is the
 * pattern
 *
 *   [opponent, empty, opponent]
 *
 * in three consecutive entries of its clockwise neighbor list, and the empty middle entry is the
 * cell to respond on.
 *
 * The neighbor list is treated as circular, so a pattern may wrap from the last neighbor to the
 * first. Matches may share their end stones: two bridges can share one stone, and a stone
 * surrounded by alternating opponent stones and empty cells attacks three bridges at once.
 * Edges take part with their fixed colors.
 *
 * Returns the empty middle cells, in the order they are found. Returns an empty vector if the
 * cell at coords is empty.
 */
std::vector<Coords> find_attacked_bridges(const HexCells& cells, Coords coords);

}  // namespace hexgame
