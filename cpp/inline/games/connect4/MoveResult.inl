#include "games/connect4/MoveResult.hpp"

#include "util/Asserts.hpp"

#include <magic_enum/magic_enum.hpp>

#include <format>

namespace c4 {

inline MoveResult MoveResult::next_turn(Player next_player, Coord landing) {
  MoveResult result(kContinue);
  result.player_ = next_player;
  result.landing_ = landing;
  return result;
}

inline MoveResult MoveResult::win(Player winner, Coord landing, const WinningLine& line) {
  MoveResult result(kWin);
  result.player_ = winner;
  result.landing_ = landing;
  result.winning_line_ = line;
  return result;
}

inline MoveResult MoveResult::tie(Coord landing) {
  MoveResult result(kTie);
  result.landing_ = landing;
  return result;
}

inline MoveResult MoveResult::rejected(RejectReason reason) {
  RELEASE_ASSERT(reason != kNotRejected);
  MoveResult result(kRejected);
  result.reason_ = reason;
  return result;
}

inline Player MoveResult::player() const {
  RELEASE_ASSERT(outcome_ == kContinue || outcome_ == kWin, "No player for outcome {}",
                 magic_enum::enum_name(outcome_));
  return player_;
}

inline const WinningLine& MoveResult::winning_line() const {
  RELEASE_ASSERT(outcome_ == kWin, "No winning line for outcome {}",
                 magic_enum::enum_name(outcome_));
  return winning_line_;
}

inline Coord MoveResult::landing() const {
  RELEASE_ASSERT(outcome_ != kRejected, "Rejected moves do not land");
  return landing_;
}

inline std::string MoveResult::to_str() const {
  switch (outcome_) {
    case kContinue:
      return std::format("Continue(next=Player {}, landing={})", player_number(player_),
                         landing_.to_str());
    case kWin: {
      std::string line;
      for (const Coord& coord : winning_line_) {
        line += coord.to_str();
      }
      return std::format("Win(Player {}, line={})", player_number(player_), line);
    }
    case kTie:
      return std::format("Tie(landing={})", landing_.to_str());
    case kRejected:
      return std::format("Rejected({})", magic_enum::enum_name(reason_));
  }
  return "?";
}

}  // namespace c4
