#pragma once

#include "games/connect4/Constants.hpp"
#include "games/connect4/Types.hpp"

#include <string>

namespace c4 {

/*
 * The outcome of GameEngine::apply_move():
 *
 * - kContinue: the checker was placed, and it is now player()'s turn.
 * - kWin: the checker was placed and completed winning_line() for player().
 * - kTie: the checker was placed and filled the board without a winner.
 * - kRejected: nothing was placed; reason() says why.
 *
 * For every outcome other than kRejected, landing() is the cell where the checker came to rest.
 */
class MoveResult {
 public:
  enum outcome_t : int8_t { kContinue, kWin, kTie, kRejected };

  static MoveResult next_turn(Player next_player, Coord landing);
  static MoveResult win(Player winner, Coord landing, const WinningLine& line);
  static MoveResult tie(Coord landing);
  static MoveResult rejected(RejectReason reason);

  outcome_t outcome() const { return outcome_; }
  bool accepted() const { return outcome_ != kRejected; }

  // Valid for kContinue (the player to move next) and kWin (the winner)
  Player player() const;

  // Valid for kWin
  const WinningLine& winning_line() const;

  // Valid for every outcome except kRejected
  Coord landing() const;

  // kNotRejected unless outcome() == kRejected
  RejectReason reason() const { return reason_; }

  std::string to_str() const;

 private:
  explicit MoveResult(outcome_t outcome) : outcome_(outcome) {}

  WinningLine winning_line_;
  Coord landing_;
  outcome_t outcome_;
  Player player_ = kPlayerA;
  RejectReason reason_ = kNotRejected;
};

}  // namespace c4

#include "inline/games/connect4/MoveResult.inl"
