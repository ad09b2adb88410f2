// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#include "logger.hpp"

#include <unistd.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "absl/strings/str_split.h"
#include "config.hpp"
#include "fmt/format.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

using ::testing::EndsWith;
using ::testing::HasSubstr;
using ::testing::MatchesRegex;

class Logger_test : public ::testing::Test {
protected:
  std::string path;

  void SetUp() override {
    path = fmt::format("{}logger_test_{}.txt",
                       ::testing::TempDir(),
                       ::testing::UnitTest::GetInstance()->current_test_info()->name());
    ::unlink(path.c_str());
    Config::clear_errors();
  }

  void TearDown() override { ::unlink(path.c_str()); }

  static Log_store::Options options() {
    Log_store::Options o;
    o.min_free_space = 0;
    return o;
  }

  // Lines written after the session marker
  static std::vector<std::string> logged_lines(Log_store &store, const std::string &header) {
    auto content = store.read_all();
    EXPECT_TRUE(content.ok());
    if (!content.ok()) {
      return {};
    }
    EXPECT_EQ(content->compare(0, header.size(), header), 0);
    return absl::StrSplit(content->substr(header.size()), '\n', absl::SkipEmpty());
  }
};

TEST_F(Logger_test, format_line) {
  auto when = absl::FromUnixSeconds(1575281472);

  EXPECT_EQ(Logger::format_line(when, "hello", Source_location{"/src/app/app.cpp", "main", 42}),
            "2019-12-02 10:11:12 | hello | app.cpp:main:L42\n");
  EXPECT_EQ(Logger::format_line(when, "x", Source_location{"plain.cpp", "f", 1}), "2019-12-02 10:11:12 | x | plain.cpp:f:L1\n");
}

TEST_F(Logger_test, variants) {
  Log_store store(options());
  ASSERT_TRUE(store.init(path).ok());
  ASSERT_TRUE(store.flush().ok());
  auto header = store.read_all();
  ASSERT_TRUE(header.ok());

  Logger logger(store);

  DIAG_LOG(logger, "Application started");
  DIAG_ERROR(logger, "missing data", "");
  DIAG_ERROR(logger, "missing data", "while loading");
  DIAG_ERROR(logger, absl::NotFoundError("no profile"), "startup");
  DIAG_ERROR(logger, std::runtime_error("bad state"), "");
  DIAG_EVENT(logger, "login", "");
  DIAG_EVENT(logger, "login", "2 attempts");
  DIAG_SCREEN(logger, "Settings");
  logger.system("printed to stdout");

  auto lines = logged_lines(store, *header);
  ASSERT_EQ(lines.size(), 9);

  const std::string ts = "[0-9]{4}-[0-9]{2}-[0-9]{2} [0-9]{2}:[0-9]{2}:[0-9]{2}";
  const std::string at = " \\| logger_test\\.cpp:TestBody:L[0-9]+";

  EXPECT_THAT(lines[0], MatchesRegex(ts + " \\| Application started" + at));
  EXPECT_THAT(lines[1], MatchesRegex(ts + " \\| ERROR: missing data" + at));
  EXPECT_THAT(lines[2], MatchesRegex(ts + " \\| ERROR: missing data \\| while loading" + at));
  EXPECT_THAT(lines[3], MatchesRegex(ts + " \\| ERROR: NOT_FOUND \\| no profile \\| startup" + at));
  EXPECT_THAT(lines[4], MatchesRegex(ts + " \\| ERROR: bad state" + at));
  EXPECT_THAT(lines[5], MatchesRegex(ts + " \\| EVENT: login" + at));
  EXPECT_THAT(lines[6], MatchesRegex(ts + " \\| EVENT: login \\| 2 attempts" + at));
  EXPECT_THAT(lines[7], MatchesRegex(ts + " \\| SCREEN: Settings" + at));
  EXPECT_EQ(lines[8], "SYSTEM: printed to stdout");
}

TEST_F(Logger_test, line_numbers_point_at_the_caller) {
  Log_store store(options());
  ASSERT_TRUE(store.init(path).ok());
  ASSERT_TRUE(store.flush().ok());
  auto header = store.read_all();
  ASSERT_TRUE(header.ok());

  Logger logger(store);

  int line = __LINE__ + 1;
  DIAG_LOG(logger, "here");

  auto lines = logged_lines(store, *header);
  ASSERT_EQ(lines.size(), 1);
  EXPECT_THAT(lines[0], EndsWith(fmt::format(":L{}", line)));
}

TEST_F(Logger_test, use_before_init) {
  Log_store store(options());
  Logger    logger(store);

#ifndef NDEBUG
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  EXPECT_DEATH(DIAG_LOG(logger, "too early"), "");
#else
  DIAG_LOG(logger, "too early");
  EXPECT_EQ(Stats::report_all()["log_store:dropped_not_ready"], "1");
#endif

  EXPECT_FALSE(store.is_ready());
}
