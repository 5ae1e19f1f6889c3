#include "hexgame/Errors.hpp"
#include "hexgame/Game.hpp"
#include "hexgame/Serialization.hpp"
#include "hexgame/Types.hpp"
#include "util/GTestUtil.hpp"

#include <boost/json.hpp>
#include <gtest/gtest.h>

#include <string>

using namespace hexgame;

TEST(Serialization, save_to_json) {
  Game game(2);
  ASSERT_TRUE(game.play(Coords{0, 1}).has_value());
  ASSERT_TRUE(game.play(Coords{1, 0}).has_value());

  boost::json::value expected = boost::json::parse(
    R"({"size": 2, "currentPlayer": 1, "cells": [[0, 1], [2, 0]]})");
  EXPECT_EQ(boost::json::value(Serialization::save_to_json(game)), expected);
  EXPECT_EQ(Serialization::save_to_string(game),
            R"({"size":2,"currentPlayer":1,"cells":[[0,1],[2,0]]})");
}

TEST(Serialization, save_white_as_current_player) {
  Game game(2);
  ASSERT_TRUE(game.play(Coords{0, 0}).has_value());

  boost::json::object obj = Serialization::save_to_json(game);
  EXPECT_EQ(obj.at("currentPlayer").as_int64(), 2);
}

TEST(Serialization, load_from_json) {
  boost::json::value value = boost::json::parse(
    R"({"size": 2, "currentPlayer": 1, "cells": [[0, 1], [2, 0]]})");

  auto game = Serialization::load_from_json(value);
  ASSERT_TRUE(game.has_value()) << game.error().to_str();
  EXPECT_EQ(game->board().size(), 2);
  EXPECT_EQ(game->get_current_player(), kBlack);
  EXPECT_FALSE(game->board().get_color(Coords{0, 0}).has_value());
  EXPECT_EQ(game->board().get_color(Coords{0, 1}), kBlack);
  EXPECT_EQ(game->board().get_color(Coords{1, 0}), kWhite);
  EXPECT_FALSE(game->board().get_color(Coords{1, 1}).has_value());
}

TEST(Serialization, load_white_as_current_player) {
  auto game = Serialization::load_from_string(
    R"({"size": 2, "currentPlayer": 2, "cells": [[1, 0], [0, 0]]})");
  ASSERT_TRUE(game.has_value()) << game.error().to_str();
  EXPECT_EQ(game->get_current_player(), kWhite);
  EXPECT_EQ(game->get_status(), Game::Status::ongoing(kWhite));
}

TEST(Serialization, string_round_trip) {
  Game game(3);
  ASSERT_TRUE(game.play(Coords{0, 1}).has_value());
  ASSERT_TRUE(game.play(Coords{1, 0}).has_value());
  ASSERT_TRUE(game.play(Coords{1, 1}).has_value());

  auto loaded = Serialization::load_from_string(Serialization::save_to_string(game));
  ASSERT_TRUE(loaded.has_value()) << loaded.error().to_str();
  EXPECT_EQ(loaded->board().size(), game.board().size());
  EXPECT_EQ(loaded->get_current_player(), game.get_current_player());
  EXPECT_EQ(loaded->board().to_stone_matrix(), game.board().to_stone_matrix());
  EXPECT_EQ(loaded->get_status(), game.get_status());
}

TEST(Serialization, load_finished_game) {
  auto game = Serialization::load_from_string(
    R"({"size": 2, "currentPlayer": 2, "cells": [[1, 2], [1, 0]]})");
  ASSERT_TRUE(game.has_value()) << game.error().to_str();
  EXPECT_EQ(game->get_status(), Game::Status::finished(kBlack));
}

TEST(Serialization, invalid_color) {
  auto cell = Serialization::load_from_string(
    R"({"size": 2, "currentPlayer": 1, "cells": [[0, 3], [0, 0]]})");
  ASSERT_FALSE(cell.has_value());
  EXPECT_EQ(cell.error(), InvalidBoard::invalid_color(3));

  auto player = Serialization::load_from_string(
    R"({"size": 2, "currentPlayer": 5, "cells": [[0, 0], [0, 0]]})");
  ASSERT_FALSE(player.has_value());
  EXPECT_EQ(player.error(), InvalidBoard::invalid_color(5));
}

TEST(Serialization, no_current_player) {
  auto game = Serialization::load_from_string(
    R"({"size": 2, "currentPlayer": 0, "cells": [[0, 0], [0, 0]]})");
  ASSERT_FALSE(game.has_value());
  EXPECT_EQ(game.error(), InvalidBoard::no_current_player());
}

TEST(Serialization, not_square) {
  auto short_row = Serialization::load_from_string(
    R"({"size": 2, "currentPlayer": 1, "cells": [[0, 0], [0]]})");
  ASSERT_FALSE(short_row.has_value());
  EXPECT_EQ(short_row.error(), InvalidBoard::not_square(2, 1));

  auto missing_row = Serialization::load_from_string(
    R"({"size": 3, "currentPlayer": 1, "cells": [[0, 0, 0], [0, 0, 0]]})");
  ASSERT_FALSE(missing_row.has_value());
  EXPECT_EQ(missing_row.error(), InvalidBoard::not_square(3, 2));
}

TEST(Serialization, size_out_of_bounds) {
  auto game = Serialization::load_from_string(
    R"({"size": 1, "currentPlayer": 1, "cells": [[0]]})");
  ASSERT_FALSE(game.has_value());
  EXPECT_EQ(game.error(), InvalidBoard::size_out_of_bounds(1));
}

TEST(Serialization, malformed_data) {
  for (const char* str : {
         R"({"size": 2, "currentPlayer": 1, "cells": [[0, 0], [0, 0])",
         R"([1, 2, 3])",
         R"({"currentPlayer": 1, "cells": [[0, 0], [0, 0]]})",
         R"({"size": 2, "cells": [[0, 0], [0, 0]]})",
         R"({"size": 2, "currentPlayer": 1})",
         R"({"size": "2", "currentPlayer": 1, "cells": [[0, 0], [0, 0]]})",
         R"({"size": 2, "currentPlayer": 1, "cells": [0, 0]})",
         R"({"size": 2, "currentPlayer": 1, "cells": [[0, "x"], [0, 0]]})",
       }) {
    auto game = Serialization::load_from_string(str);
    ASSERT_FALSE(game.has_value()) << str;
    EXPECT_EQ(game.error().kind, InvalidBoard::kMalformedData) << str;
    EXPECT_FALSE(game.error().to_str().empty());
  }
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
