#include "games/connect4/GameConfig.hpp"
#include "games/connect4/HumanTuiShell.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/program_options.hpp>

#include <iostream>

int main(int ac, char* av[]) {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  try {
    c4::GameConfig::Params game_params;
    c4::HumanTuiShell::Params shell_params;
    util::Logging::Params log_params;

    // The board owns the console, so logs go to a file or nowhere unless asked for.
    log_params.quiet = true;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                  .template add_option<"help-full">("help (all options)")
                  .add(game_params.make_options_description())
                  .add(shell_params.make_options_description())
                  .add(log_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);

    bool help_full = vm.count("help-full");
    bool help = vm.count("help");
    if (help || help_full) {
      po2::Settings::help_full = help_full;
      std::cout << desc << std::endl;
      return 0;
    }

    util::Logging::init(log_params);

    c4::GameConfig config = game_params.make_config();
    c4::HumanTuiShell shell(config, shell_params);
    int num_games = shell.run();
    LOG_INFO("Played {} game(s)", num_games);
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
