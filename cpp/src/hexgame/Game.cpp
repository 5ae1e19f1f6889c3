#include "hexgame/Game.hpp"

#include "hexgame/IO.hpp"
#include "util/LoggingUtil.hpp"

#include <utility>

namespace hexgame {

Game::Game(int size) : board_(size), current_player_(kBlack) {}

Game::Game(Board board, Color current_player, std::optional<Color> winner)
    : board_(std::move(board)), current_player_(current_player), winner_(winner) {}

std::expected<Game, InvalidBoard> Game::load(const StoneMatrix& matrix,
                                             std::optional<Color> current_player) {
  std::expected<Board, InvalidBoard> board = Board::from_stone_matrix(matrix);
  if (!board) {
    return std::unexpected(board.error());
  }
  if (!current_player) {
    return std::unexpected(InvalidBoard::no_current_player());
  }

  std::optional<Color> winner;
  for (Color color : {kBlack, kWhite}) {
    if (board->has_connected_edges(color)) {
      winner = color;
      LOG_DEBUG("Loaded a finished game won by {}", color_to_str(color));
      break;
    }
  }
  return Game(std::move(*board), *current_player, winner);
}

std::expected<void, InvalidMove> Game::play(Coords coords) {
  if (winner_) {
    return std::unexpected(InvalidMove::game_over());
  }

  std::expected<void, InvalidMove> result = board_.play(coords, current_player_);
  if (!result) {
    return result;
  }

  if (board_.has_connected_edges(current_player_)) {
    winner_ = current_player_;
    LOG_DEBUG("{} wins with {}", color_to_str(current_player_), IO::coords_to_str(coords));
  } else {
    current_player_ = opponent_color(current_player_);
  }
  return {};
}

Game::Status Game::get_status() const {
  return winner_ ? Status::finished(*winner_) : Status::ongoing(current_player_);
}

}  // namespace hexgame
