#include "games/connect4/GameConfig.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

#include <format>

namespace c4 {

inline auto GameConfig::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Game options");

  return desc
    .template add_option<"rows", 'r'>(po::value<int>(&num_rows)->default_value(num_rows),
                                      "number of rows")
    .template add_option<"columns", 'c'>(
      po::value<int>(&num_columns)->default_value(num_columns), "number of columns")
    .template add_option<"player1-color">(
      po::value<std::string>(&player1_color)->default_value(player1_color),
      "checker color of player 1, who moves first")
    .template add_option<"player2-color">(
      po::value<std::string>(&player2_color)->default_value(player2_color),
      "checker color of player 2");
}

}  // namespace c4
