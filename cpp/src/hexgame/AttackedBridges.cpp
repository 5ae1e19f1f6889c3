#include "hexgame/AttackedBridges.hpp"

#include "hexgame/Constants.hpp"
#include "hexgame/IO.hpp"
#include "hexgame/Neighbors.hpp"
#include "util/LoggingUtil.hpp"

#include <array>
#include <optional>

namespace hexgame {

namespace {

// Progress through the pattern [opponent, empty, opponent].
enum MatchState : int8_t { kFound0, kFound1, kFound2 };

}  // namespace

std::vector<Coords> find_attacked_bridges(const HexCells& cells, Coords coords) {
  std::vector<Coords> bridges;

  const index_t index = cells.index_from_coords(coords);
  const std::optional<Color> attacker = cells.get_color(index);
  if (!attacker) return bridges;
  const Color search_color = opponent_color(*attacker);

  // The first two neighbors are repeated at the end so that wrapping matches are seen.
  std::array<index_t, kMaxNumNeighbors + 2> ring;
  int count = 0;
  for (index_t neighbor : Neighbors(cells, index)) {
    ring[count++] = neighbor;
  }
  ring[count] = ring[0];
  ring[count + 1] = ring[1];

  MatchState state = kFound0;
  for (int i = 0; i < count + 2; ++i) {
    const std::optional<Color> color = cells.get_color(ring[i]);
    switch (state) {
      case kFound0:
        if (color == search_color) state = kFound1;
        break;
      case kFound1:
        if (!color) {
          state = kFound2;
        } else if (*color != search_color) {
          state = kFound0;
        }
        break;
      case kFound2:
        if (color == search_color) {
          bridges.push_back(cells.coords_from_index(ring[i - 1]));
          state = kFound1;
        } else {
          state = kFound0;
        }
        break;
    }
  }

  for (Coords bridge : bridges) {
    LOG_DEBUG("{} at {} attacks the bridge through {}", color_to_str(*attacker),
              IO::coords_to_str(coords), IO::coords_to_str(bridge));
  }
  return bridges;
}

}  // namespace hexgame
