#pragma once

#include "games/connect4/Board.hpp"
#include "games/connect4/GameConfig.hpp"
#include "games/connect4/GameEngine.hpp"

#include <iostream>
#include <optional>
#include <string>

namespace c4 {

/*
 * Hot-seat terminal front-end: both players share one keyboard.
 *
 * The shell renders the grid, reads a 1-indexed column from the player to move, and forwards it to
 * the GameEngine. Columns that cannot take a checker are refused by the shell before the engine
 * sees them, the terminal equivalent of disabling their buttons. When a game ends, the shell
 * announces the result and offers to play again.
 */
class HumanTuiShell {
 public:
  struct Params {
    bool dump_json = false;
    bool clear_screen = true;

    auto make_options_description();
  };

  // config must already be validated (see GameConfig::validate()).
  HumanTuiShell(const GameConfig& config, const Params& params, std::istream& in = std::cin,
                std::ostream& out = std::cout);

  // engine_ refers to board_
  HumanTuiShell(const HumanTuiShell&) = delete;
  HumanTuiShell& operator=(const HumanTuiShell&) = delete;

  // Plays games until the user declines to play again or the input ends. Returns the number of
  // games that were played to completion.
  int run();

  const GameEngine& engine() const { return engine_; }

 private:
  // Returns false if the input ended before the game did.
  bool play_game();

  // Reads a column choice that the engine can accept. Returns false on end of input.
  bool prompt_for_column(int& col);

  bool prompt_play_again();

  // Clears the screen if enabled. If clearing fails, logs a warning and stops trying.
  void render();

  // Reads one line; returns false on end of input.
  bool read_line(std::string& line);

  // "3" -> 2. Returns std::nullopt unless line is a single positive integer.
  static std::optional<int> parse_column(const std::string& line);

  const GameConfig config_;
  const Params params_;
  bool clear_screen_;
  std::istream& in_;
  std::ostream& out_;
  Board board_;
  GameEngine engine_;
};

}  // namespace c4

#include "inline/games/connect4/HumanTuiShell.inl"
