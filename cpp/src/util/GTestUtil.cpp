#include "util/GTestUtil.hpp"

#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <gtest/gtest.h>

#include <iostream>
#include <string>

namespace {

bool has_arg(int argc, char** argv, const std::string& arg) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == arg) return true;
  }
  return false;
}

}  // namespace

// Our options are parsed from what InitGoogleTest() leaves in argv after removing the gtest flags.
// Help is handled before that, since each parser rejects the options of the other.
int launch_gtest(int argc, char** argv) {
  namespace po2 = boost_util::program_options;

  util::Logging::Params log_params;
  log_params.omit_timestamps = true;

  po2::options_description raw_desc("Options");
  auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                .template add_option<"help-full">("help (all options)")
                .add(log_params.make_options_description());

  bool help = has_arg(argc, argv, "--help") || has_arg(argc, argv, "-h");
  bool help_full = has_arg(argc, argv, "--help-full");
  if (help || help_full) {
    po2::Settings::help_full = help_full;
    std::cout << desc << std::endl;

    // gtest does not know --help-full
    char help_arg[] = "--help";
    char* gtest_argv[] = {argv[0], help_arg, nullptr};
    int gtest_argc = 2;
    testing::InitGoogleTest(&gtest_argc, gtest_argv);
    return 0;
  }

  testing::InitGoogleTest(&argc, argv);
  try {
    po2::parse_args(desc, argc, argv);
    util::Logging::init(log_params);
  } catch (const util::CleanException& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  return RUN_ALL_TESTS();
}
