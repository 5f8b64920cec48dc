#pragma once

#include "games/connect4/Constants.hpp"
#include "games/connect4/Types.hpp"

#include <array>
#include <string>

namespace c4 {

// Display colors. The core never looks at them; they exist for the presentation layer.
enum Color : int8_t { kRed, kYellow, kBlack, kGreen, kBlue, kWhite, kCyan, kGray };

// Case-insensitive: "red", "Red", "RED" all map to kRed. Throws InvalidConfiguration on an unknown
// name.
Color parse_color(const std::string& name);

// kRed -> "red"
std::string color_to_str(Color color);

// "red, yellow, ..., and gray"
std::string valid_color_names();

/*
 * Construction-time configuration of a game: board dimensions and one display color per player.
 *
 * Colors used by the renderer for the board itself are reserved and cannot be picked by a player.
 */
struct GameConfig {
  static constexpr Color kBoardColor = kBlue;
  static constexpr Color kEmptyColor = kWhite;
  static constexpr Color kHighlightColor = kCyan;

  // Command-line view of a GameConfig. Colors stay strings until make_config().
  struct Params {
    int num_rows = kDefaultNumRows;
    int num_columns = kDefaultNumColumns;
    std::string player1_color = "red";
    std::string player2_color = "yellow";

    auto make_options_description();

    // Parses the colors and validates the result
    GameConfig make_config() const;
  };

  Color color_of(Player player) const { return player_colors[player]; }

  // Throws InvalidConfiguration on a dimension outside [kMinDimension, kMaxDimension], on equal
  // player colors, or on a player color that is one of the reserved colors.
  void validate() const;

  int num_rows = kDefaultNumRows;
  int num_columns = kDefaultNumColumns;
  std::array<Color, kNumPlayers> player_colors = {kRed, kYellow};
};

}  // namespace c4

#include "inline/games/connect4/GameConfig.inl"
