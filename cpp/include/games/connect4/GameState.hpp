#pragma once

#include "games/connect4/Constants.hpp"
#include "games/connect4/Types.hpp"

namespace c4 {

/*
 * Everything GameEngine tracks beyond the cell contents, which live in Board.
 *
 * winner and winning_line are only meaningful when phase == kWon.
 */
struct GameState {
  Player current_player = kPlayerA;
  Phase phase = kInProgress;
  Player winner = kPlayerA;
  WinningLine winning_line;
  Coord last_move = kNullCoord;  // where the most recent checker landed
  int num_moves = 0;
};

}  // namespace c4
