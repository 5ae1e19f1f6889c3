#pragma once

#include "hexgame/Board.hpp"
#include "hexgame/Constants.hpp"
#include "hexgame/Errors.hpp"
#include "hexgame/Types.hpp"

#include <expected>
#include <optional>

namespace hexgame {

/*
 * A game of Hex: a Board plus turn order and win detection. Black moves first.
 *
 * Black wins by connecting the top and bottom edges, White by connecting the left and right edges.
 * Hex cannot end in a draw, so the game is over exactly when one of the two connections exists.
 */
class Game {
 public:
  struct Status {
    enum Kind : int8_t { kOngoing, kFinished };

    static Status ongoing(Color current_player) { return {kOngoing, current_player}; }
    static Status finished(Color winner) { return {kFinished, winner}; }

    bool is_finished() const { return kind == kFinished; }
    bool operator==(const Status&) const = default;

    Kind kind;
    Color color;  // the player to move if kOngoing, the winner if kFinished
  };

  explicit Game(int size = kDefaultBoardSize);

  /*
   * Rebuilds a game from a stone matrix. If the position already contains a winning connection,
   * the loaded game is finished and current_player is only kept for get_current_player().
   */
  [[nodiscard]] static std::expected<Game, InvalidBoard> load(
    const StoneMatrix& matrix, std::optional<Color> current_player);

  /*
   * Places a stone of the current player at coords. On success the turn passes to the opponent,
   * unless the move wins the game. On failure nothing changes.
   */
  [[nodiscard]] std::expected<void, InvalidMove> play(Coords coords);

  Status get_status() const;
  Color get_current_player() const { return current_player_; }
  const Board& board() const { return board_; }

 private:
  Game(Board board, Color current_player, std::optional<Color> winner);

  Board board_;
  Color current_player_;
  std::optional<Color> winner_;
};

}  // namespace hexgame
