#pragma once

#include "games/connect4/Board.hpp"
#include "games/connect4/Constants.hpp"
#include "games/connect4/GameConfig.hpp"
#include "games/connect4/GameEngine.hpp"

#include <boost/json.hpp>

#include <ostream>
#include <string>

namespace c4 {

/*
 * Read-only projections of a GameEngine for the presentation layer.
 *
 * print_state() honors util::Rendering: in kTerminal mode checkers are colored circles, the last
 * placed checker blinks and the winning line is drawn in the highlight color. In kText mode
 * checkers are the letters A and B, the winning line is drawn with '*', and an 'x' above the grid
 * marks the column of the last move.
 */
struct IO {
  static void print_state(std::ostream&, const GameEngine& engine, const GameConfig& config);

  // One line per row, top row first, each cell one of 'A', 'B', '_'.
  static std::string compact_state_repr(const Board& board);

  // Everything a graphical front-end needs to draw the grid.
  static boost::json::value state_to_json(const GameEngine& engine);

  // The player's checker, colored in kTerminal mode
  static std::string player_to_str(Player player, const GameConfig& config);

  // "Player 1's turn...", "Player 2 Wins!" or "It's A Tie"
  static std::string status_str(const GameEngine& engine);

  static const char* phase_to_str(Phase phase);

 private:
  static std::string row_str(const GameEngine& engine, const GameConfig& config, row_t row);
  static std::string column_labels(int num_columns);
  static const char* color_code(Color color);
};

}  // namespace c4
