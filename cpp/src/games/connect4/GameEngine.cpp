#include "games/connect4/GameEngine.hpp"

#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"

#include <magic_enum/magic_enum.hpp>

#include <optional>

namespace c4 {

GameEngine::GameEngine(Board& board) : board_(board) { reset(); }

MoveResult GameEngine::apply_move(int col) {
  RejectReason reason = kNotRejected;
  std::optional<row_t> row;
  if (state_.phase != kInProgress) {
    reason = kGameOver;
  } else if (!board_.is_valid_column(col)) {
    reason = kInvalidColumn;
  } else if (!(row = board_.drop_row(col))) {
    reason = kColumnFull;
  }

  if (reason != kNotRejected) {
    LOG_WARN("Rejected move by Player {} in column {}: {}",
             player_number(state_.current_player), col, magic_enum::enum_name(reason));
    return MoveResult::rejected(reason);
  }

  Player player = state_.current_player;
  Coord landing(*row, col);
  board_.place(landing.row, landing.col, player);
  state_.last_move = landing;
  state_.num_moves++;

  LOG_DEBUG("Move {}: Player {} -> {}", state_.num_moves, player_number(player),
            landing.to_str());

  WinningLine line;
  if (find_winning_line(line)) {
    Player winner = to_player(board_.occupant_at(line[0].row, line[0].col));
    RELEASE_ASSERT(winner == player, "Player {} completed a line owned by Player {}",
                   player_number(player), player_number(winner));

    state_.phase = kWon;
    state_.winner = winner;
    state_.winning_line = line;
    LOG_INFO("Player {} wins after {} moves", player_number(winner), state_.num_moves);
    return MoveResult::win(winner, landing, line);
  }

  if (board_.is_full()) {
    state_.phase = kTied;
    LOG_INFO("Tie after {} moves", state_.num_moves);
    return MoveResult::tie(landing);
  }

  state_.current_player = opponent(player);
  return MoveResult::next_turn(state_.current_player, landing);
}

void GameEngine::reset() {
  board_.reset();
  state_ = GameState();
  LOG_INFO("New {}x{} game", board_.num_rows(), board_.num_columns());
}

bool GameEngine::find_winning_line(WinningLine& line) const {
  return scan_rows(line) || scan_columns(line) || scan_diagonals(1, line) ||
         scan_diagonals(-1, line);
}

bool GameEngine::scan_rows(WinningLine& line) const {
  for (int row = 0; row < board_.num_rows(); ++row) {
    int run = 0;
    for (int col = 1; col < board_.num_columns(); ++col) {
      Cell cell = board_.occupant_at(row, col);
      if (cell != kEmptyCell && cell == board_.occupant_at(row, col - 1)) {
        run++;
      } else {
        run = 0;
      }

      if (run == kWinLength - 1) {
        for (int i = 0; i < kWinLength; ++i) {
          line[i] = Coord(row, col - (kWinLength - 1) + i);
        }
        return true;
      }
    }
  }
  return false;
}

bool GameEngine::scan_columns(WinningLine& line) const {
  for (int col = 0; col < board_.num_columns(); ++col) {
    int run = 0;
    for (int row = 1; row < board_.num_rows(); ++row) {
      Cell cell = board_.occupant_at(row, col);
      if (cell != kEmptyCell && cell == board_.occupant_at(row - 1, col)) {
        run++;
      } else {
        run = 0;
      }

      if (run == kWinLength - 1) {
        for (int i = 0; i < kWinLength; ++i) {
          line[i] = Coord(row - (kWinLength - 1) + i, col);
        }
        return true;
      }
    }
  }
  return false;
}

bool GameEngine::scan_diagonals(int d_row, WinningLine& line) const {
  constexpr int kSpan = kWinLength - 1;
  for (int row = 0; row < board_.num_rows(); ++row) {
    for (int col = 0; col + kSpan < board_.num_columns(); ++col) {
      if (!board_.in_bounds(row + kSpan * d_row, col + kSpan)) continue;

      Cell cell = board_.occupant_at(row, col);
      if (cell == kEmptyCell) continue;

      bool match = true;
      for (int i = 1; i < kWinLength && match; ++i) {
        match = board_.occupant_at(row + i * d_row, col + i) == cell;
      }

      if (match) {
        for (int i = 0; i < kWinLength; ++i) {
          line[i] = Coord(row + i * d_row, col + i);
        }
        return true;
      }
    }
  }
  return false;
}

}  // namespace c4
