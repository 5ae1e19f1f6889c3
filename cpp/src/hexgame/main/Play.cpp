/*
 * Two humans play a game of Hex in the terminal, taking turns on the same keyboard.
 *
 * Moves are entered either as a column letter plus row number ("c4") or as zero-based
 * "row,column" ("3,2"). After every move, the bridges attacked by that move are listed so that the
 * defender knows where to answer.
 */
#include "hexgame/Constants.hpp"
#include "hexgame/Game.hpp"
#include "hexgame/IO.hpp"
#include "hexgame/Types.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/StringUtil.hpp"

#include <boost/program_options.hpp>
#include <fmt/format.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct Params {
  int board_size = hexgame::kDefaultBoardSize;

  auto make_options_description();
};

auto Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Play options");
  return desc.template add_option<"board-size", 's'>(
    po::value<int>(&board_size)->default_value(board_size),
    fmt::format("board size, between {} and {}", hexgame::kMinBoardSize, hexgame::kMaxBoardSize)
      .c_str());
}

std::optional<hexgame::Coords> read_coords(const std::string& input) {
  std::optional<hexgame::Coords> coords = hexgame::IO::parse_coords(input);
  if (!coords) coords = hexgame::IO::parse_row_column(input);
  return coords;
}

void print_attacked_bridges(const std::vector<hexgame::Coords>& bridges) {
  if (bridges.empty()) return;

  std::cout << "Attacked bridges:";
  for (hexgame::Coords bridge : bridges) {
    std::cout << ' ' << hexgame::IO::coords_to_str(bridge);
  }
  std::cout << std::endl;
}

int play(const Params& params) {
  using namespace hexgame;

  Game game(params.board_size);
  LOG_INFO("Starting a game of size {}", params.board_size);

  while (!game.get_status().is_finished()) {
    IO::print_board(std::cout, game.board());
    std::cout << color_to_str(game.get_current_player())
              << ": Please enter the coordinates for your next move: " << std::flush;

    std::string line;
    if (!std::getline(std::cin, line)) {
      std::cout << std::endl;
      LOG_INFO("End of input, quitting");
      return 0;
    }
    line = util::strip(line);

    std::optional<Coords> coords = read_coords(line);
    if (!coords) {
      std::cout << "Error: Invalid coordinates \"" << line << "\". Try something like c4 or 2,3"
                << std::endl;
      continue;
    }

    const int size = game.board().size();
    if (!coords->is_on_board_with_size(size)) {
      std::cout << fmt::format("Error: Coordinates must be in range a1 - {} (or 0,0 - {},{})",
                               IO::coords_to_str(Coords{size - 1, size - 1}), size - 1, size - 1)
                << std::endl;
      continue;
    }

    auto result = game.play(*coords);
    if (!result) {
      std::cout << "Error: " << result.error().to_str() << std::endl;
      continue;
    }
    print_attacked_bridges(game.board().find_attacked_bridges(*coords));
  }

  IO::print_board(std::cout, game.board());
  Color winner = game.get_status().color;
  std::cout << color_to_str(winner) << " wins!" << std::endl;
  LOG_INFO("Game over, {} wins", color_to_str(winner));
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  namespace po2 = boost_util::program_options;

  try {
    Params params;
    util::Logging::Params log_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                  .template add_option<"help-full">("help (all options)")
                  .add(params.make_options_description())
                  .add(log_params.make_options_description());

    boost::program_options::variables_map vm = po2::parse_args(desc, argc, argv);
    if (vm.count("help") || vm.count("help-full")) {
      po2::Settings::help_full = vm.count("help-full");
      std::cout << desc << std::endl;
      return 0;
    }

    util::Logging::init(log_params);
    return play(params);
  } catch (const util::CleanException& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
}
