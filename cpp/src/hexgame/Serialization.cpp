#include "hexgame/Serialization.hpp"

#include "hexgame/Board.hpp"
#include "hexgame/Constants.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/json/src.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace hexgame {

namespace {

std::expected<int64_t, InvalidBoard> get_int(const boost::json::object& obj, const char* key) {
  const boost::json::value* value = obj.if_contains(key);
  if (!value) {
    return std::unexpected(InvalidBoard::malformed_data(fmt::format("Missing field \"{}\"", key)));
  }
  if (const int64_t* i = value->if_int64()) {
    return *i;
  }
  if (const uint64_t* u = value->if_uint64()) {
    return int64_t(std::min<uint64_t>(*u, INT64_MAX));
  }
  return std::unexpected(
    InvalidBoard::malformed_data(fmt::format("Field \"{}\" must be an integer", key)));
}

std::expected<StoneMatrix, InvalidBoard> load_cells(const boost::json::object& obj) {
  const boost::json::value* value = obj.if_contains("cells");
  if (!value) {
    return std::unexpected(InvalidBoard::malformed_data("Missing field \"cells\""));
  }
  const boost::json::array* rows = value->if_array();
  if (!rows) {
    return std::unexpected(InvalidBoard::malformed_data("Field \"cells\" must be an array"));
  }

  StoneMatrix matrix;
  matrix.reserve(rows->size());
  for (const boost::json::value& row_value : *rows) {
    const boost::json::array* row = row_value.if_array();
    if (!row) {
      return std::unexpected(
        InvalidBoard::malformed_data("Every row of \"cells\" must be an array"));
    }

    std::vector<std::optional<Color>>& stones = matrix.emplace_back();
    stones.reserve(row->size());
    for (const boost::json::value& cell : *row) {
      const int64_t* code = cell.if_int64();
      if (!code) {
        return std::unexpected(InvalidBoard::malformed_data("Every cell must be an integer"));
      }
      auto color = Serialization::decode_color(*code);
      if (!color) {
        return std::unexpected(color.error());
      }
      stones.push_back(*color);
    }
  }
  return matrix;
}

}  // namespace

boost::json::object Serialization::save_to_json(const Game& game) {
  const Board& board = game.board();

  boost::json::array cells;
  for (const auto& row : board.to_stone_matrix()) {
    boost::json::array codes;
    for (std::optional<Color> color : row) {
      codes.push_back(encode_color(color));
    }
    cells.push_back(std::move(codes));
  }

  boost::json::object obj;
  obj["size"] = board.size();
  obj["currentPlayer"] = encode_color(game.get_current_player());
  obj["cells"] = std::move(cells);
  return obj;
}

std::string Serialization::save_to_string(const Game& game) {
  return boost::json::serialize(save_to_json(game));
}

std::expected<Game, InvalidBoard> Serialization::load_from_json(const boost::json::value& value) {
  const boost::json::object* obj = value.if_object();
  if (!obj) {
    return std::unexpected(InvalidBoard::malformed_data("Expected a JSON object"));
  }

  auto size = get_int(*obj, "size");
  if (!size) return std::unexpected(size.error());
  auto current_player_code = get_int(*obj, "currentPlayer");
  if (!current_player_code) return std::unexpected(current_player_code.error());
  auto matrix = load_cells(*obj);
  if (!matrix) return std::unexpected(matrix.error());

  if (*size < kMinBoardSize || *size > kMaxBoardSize) {
    return std::unexpected(InvalidBoard::size_out_of_bounds(int(*size)));
  }
  const int num_rows = matrix->size();
  if (num_rows != *size) {
    // the first row that is missing or should not be there
    return std::unexpected(InvalidBoard::not_square(int(*size), std::min(num_rows, int(*size))));
  }

  auto current_player = decode_color(*current_player_code);
  if (!current_player) return std::unexpected(current_player.error());

  LOG_DEBUG("Loading game of size {} from json", *size);
  return Game::load(*matrix, *current_player);
}

std::expected<Game, InvalidBoard> Serialization::load_from_string(const std::string& str) {
  boost::system::error_code ec;
  boost::json::value value = boost::json::parse(str, ec);
  if (ec) {
    return std::unexpected(InvalidBoard::malformed_data(ec.message()));
  }
  return load_from_json(value);
}

int64_t Serialization::encode_color(std::optional<Color> color) {
  if (!color) return 0;
  return *color == kBlack ? 1 : 2;
}

std::expected<std::optional<Color>, InvalidBoard> Serialization::decode_color(int64_t code) {
  switch (code) {
    case 0:
      return std::nullopt;
    case 1:
      return kBlack;
    case 2:
      return kWhite;
    default:
      return std::unexpected(InvalidBoard::invalid_color(code));
  }
}

}  // namespace hexgame
