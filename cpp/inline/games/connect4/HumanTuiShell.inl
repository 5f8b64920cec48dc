#include "games/connect4/HumanTuiShell.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace c4 {

inline auto HumanTuiShell::Params::make_options_description() {
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Terminal UI options");

  return desc
    .template add_flag<"dump-json", "no-dump-json">(
      &dump_json, "print the JSON state projection after every move", "do not print JSON")
    .template add_flag<"clear-screen", "no-clear-screen">(
      &clear_screen, "clear the screen before drawing the board", "do not clear the screen");
}

}  // namespace c4
