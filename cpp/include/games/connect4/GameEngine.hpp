#pragma once

#include "games/connect4/Board.hpp"
#include "games/connect4/Constants.hpp"
#include "games/connect4/GameState.hpp"
#include "games/connect4/MoveResult.hpp"
#include "games/connect4/Types.hpp"

namespace c4 {

/*
 * Owns the turn order and game lifecycle of a single game played on a Board:
 *
 *   kInProgress --apply_move()--> kWon | kTied --reset()--> kInProgress
 *
 * The Board is owned by the caller and must outlive the engine. All mutations of the board go
 * through apply_move() and reset().
 *
 * apply_move() validates before it mutates: a rejected move leaves both the board and the game
 * state untouched.
 *
 * Not thread-safe. Callers that share an engine across threads must serialize apply_move() calls.
 */
class GameEngine {
 public:
  // Resets board, so that every game starts from an empty grid.
  explicit GameEngine(Board& board);

  MoveResult apply_move(int col);

  // Empties the board and starts a new game with kPlayerA to move.
  void reset();

  Cell occupant_at(row_t row, column_t col) const { return board_.occupant_at(row, col); }
  Player current_player() const { return state_.current_player; }
  Phase phase() const { return state_.phase; }
  const GameState& state() const { return state_; }
  const Board& board() const { return board_; }

  // Columns that accept a drop. All bits are off once the game is over.
  ColumnMask legal_columns() const;

 private:
  // Scans the whole board for a four-in-a-row. Scan order: rows top-to-bottom, columns
  // left-to-right, down-right diagonals, up-right diagonals. The first line found is written to
  // line.
  bool find_winning_line(WinningLine& line) const;

  bool scan_rows(WinningLine& line) const;
  bool scan_columns(WinningLine& line) const;

  // Checks every anchor cell (top-to-bottom, left-to-right) together with the kWinLength - 1
  // cells extending to the right, moving d_row rows per step (+1 = down-right, -1 = up-right).
  bool scan_diagonals(int d_row, WinningLine& line) const;

  Board& board_;
  GameState state_;
};

}  // namespace c4

#include "inline/games/connect4/GameEngine.inl"
