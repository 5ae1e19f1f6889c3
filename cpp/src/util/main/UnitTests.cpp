#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/CppUtil.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/StringUtil.hpp"

#include <boost/program_options.hpp>
#include <gtest/gtest.h>

#include <string>
#include <vector>

TEST(StringUtil, split) {
  std::vector<std::string> result1 = util::split("a,b,c", ",");
  std::vector<std::string> result2 = util::split(" a \tb   c ");
  std::vector<std::string> result3 = util::split("a,,b,", ",");

  EXPECT_EQ(result1, std::vector<std::string>({"a", "b", "c"}));
  EXPECT_EQ(result2, std::vector<std::string>({"a", "b", "c"}));
  EXPECT_EQ(result3, std::vector<std::string>({"a", "", "b", ""}));

  EXPECT_EQ(util::split("", ","), std::vector<std::string>({""}));
  EXPECT_TRUE(util::split("  \n").empty());
}

TEST(StringUtil, strip) {
  EXPECT_EQ(util::strip("  a b \t\n"), "a b");
  EXPECT_EQ(util::strip("abc"), "abc");
  EXPECT_EQ(util::strip("   "), "");
  EXPECT_EQ(util::strip(""), "");
}

TEST(StringUtil, parse_int) {
  EXPECT_EQ(util::parse_int("0"), 0);
  EXPECT_EQ(util::parse_int("42"), 42);
  EXPECT_EQ(util::parse_int("-7"), -7);

  EXPECT_FALSE(util::parse_int("").has_value());
  EXPECT_FALSE(util::parse_int("abc").has_value());
  EXPECT_FALSE(util::parse_int("12abc").has_value());
  EXPECT_FALSE(util::parse_int(" 12").has_value());
  EXPECT_FALSE(util::parse_int("1.5").has_value());
  EXPECT_FALSE(util::parse_int("99999999999999999999").has_value());
}

TEST(StringUtil, make_whitespace) {
  EXPECT_EQ(util::make_whitespace(0), "");
  EXPECT_EQ(util::make_whitespace(3), "   ");
}

TEST(Exception, formatting) {
  util::Exception e("x={} y={}", 3, "abc");
  EXPECT_STREQ(e.what(), "x=3 y=abc");
}

TEST(Asserts, release_assert) {
  EXPECT_NO_THROW(RELEASE_ASSERT(1 + 1 == 2));
  EXPECT_THROW(RELEASE_ASSERT(1 + 1 == 3), util::ReleaseAssertionError);

  try {
    int x = 5;
    RELEASE_ASSERT(x < 0, "x={}", x);
    FAIL() << "RELEASE_ASSERT did not throw";
  } catch (const util::ReleaseAssertionError& e) {
    std::string what = e.what();
    EXPECT_NE(what.find("RELEASE_ASSERT failed: x=5"), std::string::npos) << what;
  }
}

TEST(Asserts, debug_assert_follows_build_type) {
  if (IS_MACRO_ENABLED(DEBUG_BUILD)) {
    EXPECT_THROW(DEBUG_ASSERT(false, "debug {}", 1), util::DebugAssertionError);
  } else {
    EXPECT_NO_THROW(DEBUG_ASSERT(false, "debug {}", 1));
  }
}

TEST(Asserts, clean_assert_is_clean) {
  EXPECT_THROW(CLEAN_ASSERT(false, "bad input {}", 1), util::CleanException);
}

TEST(CppUtil, no_overlap) {
  using S1 = util::StringLiteralSequence<"foo", "bar">;
  using S2 = util::StringLiteralSequence<"baz">;
  using S3 = util::StringLiteralSequence<"bar">;
  static_assert(util::no_overlap_v<S1, S2>);
  static_assert(!util::no_overlap_v<S1, S3>);
  static_assert(util::no_overlap_v<util::int_sequence<1, 2>, util::int_sequence<3>>);
  static_assert(!util::no_overlap_v<util::int_sequence<1, 2>, util::int_sequence<2>>);
  static_assert(IS_MACRO_ENABLED(1));
}

TEST(BoostUtil, parse_args) {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  int size = 11;
  bool verbose = false;
  po2::options_description raw_desc("Test options");
  auto desc = raw_desc.template add_option<"size", 's'>(po::value<int>(&size), "size")
                .template add_flag<"verbose", "quiet">(&verbose, "verbose", "quiet");

  const char* argv[] = {"prog", "-s", "7", "--verbose"};
  po2::parse_args(desc, 4, argv);
  EXPECT_EQ(size, 7);
  EXPECT_TRUE(verbose);

  const char* bad_argv[] = {"prog", "--unknown"};
  EXPECT_THROW(po2::parse_args(desc, 2, bad_argv), util::CleanException);

  const char* bad_value_argv[] = {"prog", "--size", "abc"};
  EXPECT_THROW(po2::parse_args(desc, 3, bad_value_argv), util::CleanException);
}

TEST(LoggingUtil, unknown_log_level) {
  util::Logging::Params params;
  params.omit_timestamps = true;
  params.log_level = "loud";
  EXPECT_THROW(util::Logging::init(params), util::CleanException);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
