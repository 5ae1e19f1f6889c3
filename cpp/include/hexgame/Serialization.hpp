#pragma once

#include "hexgame/Errors.hpp"
#include "hexgame/Game.hpp"
#include "hexgame/Types.hpp"

#include <boost/json.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace hexgame {

/*
 * JSON format of a saved game:
 *
 * {"size": 3, "currentPlayer": 1, "cells": [[0, 1, 0], [2, 0, 0], [0, 0, 0]]}
 *
 * Colors are encoded as 0 (empty), 1 (Black) and 2 (White). cells is row-major. currentPlayer is
 * never 0 in a saved game.
 *
 * The status of a loaded game is recomputed from the cells, so a finished game loads as finished.
 */
struct Serialization {
  static boost::json::object save_to_json(const Game& game);
  static std::string save_to_string(const Game& game);

  [[nodiscard]] static std::expected<Game, InvalidBoard> load_from_json(
    const boost::json::value& value);
  [[nodiscard]] static std::expected<Game, InvalidBoard> load_from_string(const std::string& str);

  static int64_t encode_color(std::optional<Color> color);
  [[nodiscard]] static std::expected<std::optional<Color>, InvalidBoard> decode_color(
    int64_t code);
};

}  // namespace hexgame
