#include "hexgame/Types.hpp"

namespace hexgame {

inline const char* color_to_str(Color color) { return color == kBlack ? "BLACK" : "WHITE"; }

}  // namespace hexgame
