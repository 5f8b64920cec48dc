#include "games/connect4/GameConfig.hpp"

#include "games/connect4/Board.hpp"

#include "util/StringUtil.hpp"

#include <magic_enum/magic_enum.hpp>

#include <string_view>
#include <vector>

namespace c4 {

Color parse_color(const std::string& name) {
  std::string lowered = util::to_lower(name);
  for (Color color : magic_enum::enum_values<Color>()) {
    if (color_to_str(color) == lowered) return color;
  }
  throw InvalidConfiguration("Unknown color \"{}\" (valid colors: {})", name,
                             valid_color_names());
}

std::string color_to_str(Color color) {
  // enumerator names are of the form "kRed"
  std::string_view name = magic_enum::enum_name(color);
  return util::to_lower(name.substr(1));
}

std::string valid_color_names() {
  std::vector<std::string> names;
  for (Color color : magic_enum::enum_values<Color>()) {
    names.push_back(color_to_str(color));
  }
  return util::grammatically_join(names, "and");
}

GameConfig GameConfig::Params::make_config() const {
  GameConfig config;
  config.num_rows = num_rows;
  config.num_columns = num_columns;
  config.player_colors = {parse_color(player1_color), parse_color(player2_color)};
  config.validate();
  return config;
}

void GameConfig::validate() const {
  Board::validate_dimensions(num_rows, num_columns);

  if (player_colors[kPlayerA] == player_colors[kPlayerB]) {
    throw InvalidConfiguration("Both players cannot use the color {}",
                               color_to_str(player_colors[kPlayerA]));
  }

  for (Color color : player_colors) {
    if (color == kBoardColor || color == kEmptyColor || color == kHighlightColor) {
      throw InvalidConfiguration(
        "The color {} is reserved for the board (board={}, empty={}, highlight={})",
        color_to_str(color), color_to_str(kBoardColor), color_to_str(kEmptyColor),
        color_to_str(kHighlightColor));
    }
  }
}

}  // namespace c4
