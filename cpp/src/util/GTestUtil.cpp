#include "util/GTestUtil.hpp"

#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Rendering.hpp"

#include <iostream>

int launch_gtest(int argc, char** argv) {
  namespace po2 = boost_util::program_options;

  // Consumes the --gtest_* flags, leaving the logging options in argv. On --help, gtest prints its
  // own usage here and leaves --help in argv for us.
  testing::InitGoogleTest(&argc, argv);

  util::Logging::Params log_params;
  log_params.quiet = true;

  po2::options_description raw_desc("Test options");
  auto desc = raw_desc.template add_option<"help", 'h'>("help")
                .add(log_params.make_options_description());

  if (po2::parse_args(desc, argc, argv).count("help")) {
    std::cout << desc << std::endl;
    return 0;
  }

  util::Logging::init(log_params);
  util::Rendering::set(util::Rendering::kText);
  return RUN_ALL_TESTS();
}
