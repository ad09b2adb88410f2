// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#include "reporters.hpp"

#include <unistd.h>

#include <fstream>
#include <string>

#include "config.hpp"
#include "fmt/format.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "report_compiler.hpp"
#include "stats.hpp"

using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::Key;
using ::testing::Not;
using ::testing::Pair;

class Reporters_test : public ::testing::Test {
protected:
  std::string path;

  void SetUp() override {
    path = fmt::format("{}reporters_test_{}.txt",
                       ::testing::TempDir(),
                       ::testing::UnitTest::GetInstance()->current_test_info()->name());
    ::unlink(path.c_str());
    Config::clear_errors();
  }

  void TearDown() override {
    ::unlink(path.c_str());
    Config::clear_errors();
  }

  static Log_store::Options options() {
    Log_store::Options o;
    o.min_free_space      = 0;
    o.session.app_version = "3.2";
    o.session.app_build   = "77";
    return o;
  }
};

TEST_F(Reporters_test, logs_chapter_has_the_whole_file) {
  Log_store store(options());
  ASSERT_TRUE(store.init(path).ok());
  ASSERT_TRUE(store.append("first\n").ok());
  ASSERT_TRUE(store.append("second\n").ok());

  Logs_reporter reporter(store);
  auto          chapter = reporter.produce_chapter();

  EXPECT_EQ(chapter.get_title(), "Logs");
  const auto &txt = std::get<std::string>(chapter.get_content());
  EXPECT_THAT(txt, HasSubstr("Version: 3.2 (77)\n"));
  EXPECT_THAT(txt, HasSubstr("first\nsecond\n"));

  auto content = store.read_all();
  ASSERT_TRUE(content.ok());
  EXPECT_EQ(txt, *content);
}

TEST_F(Reporters_test, logs_chapter_before_init) {
  Log_store     store(options());
  Logs_reporter reporter(store);

  auto chapter = reporter.produce_chapter();
  EXPECT_EQ(chapter.get_title(), "Logs");
  EXPECT_THAT(std::get<std::string>(chapter.get_content()), HasSubstr("Could not read the logs"));
}

TEST_F(Reporters_test, logs_chapter_after_clear_is_empty) {
  Log_store store(options());
  ASSERT_TRUE(store.init(path).ok());
  ASSERT_TRUE(store.append("gone\n").ok());
  ASSERT_TRUE(store.clear().ok());

  Logs_reporter reporter(store);
  auto          chapter = reporter.produce_chapter();

  EXPECT_EQ(std::get<std::string>(chapter.get_content()), "");
}

TEST_F(Reporters_test, host_chapter) {
  Log_store store(options());
  ASSERT_TRUE(store.init(path).ok());

  Host_reporter reporter(store, "demo");
  auto          chapter = reporter.produce_chapter();

  EXPECT_EQ(chapter.get_title(), "System metadata");
  EXPECT_EQ(chapter.get_anchor(), "system-metadata");

  const auto &dict = std::get<Chapter_dictionary>(chapter.get_content());
  EXPECT_THAT(dict, Contains(Pair("App name", "demo")));
  EXPECT_THAT(dict, Contains(Pair("App version", "3.2 (77)")));
  EXPECT_THAT(dict, Contains(Pair("Log file", path)));
  EXPECT_THAT(dict, Contains(Key("System")));
  EXPECT_THAT(dict, Contains(Key("Locale")));
  EXPECT_THAT(dict, Contains(Key("Timezone")));
  EXPECT_THAT(dict, Contains(Key("Free disk space")));
  EXPECT_THAT(dict, Contains(Key("Log size")));
}

TEST_F(Reporters_test, config_chapter_lists_used_values) {
  const std::string conf = fmt::format("{}reporters_test.toml", ::testing::TempDir());
  {
    std::ofstream f(conf);
    f << "[diagnostics]\n";
    f << "app_name = \"demo\"\n";
    f << "max_size = 4096\n";
  }

  Config::init(conf);
  EXPECT_EQ(Config::get_string("diagnostics", "app_name"), "demo");
  EXPECT_EQ(Config::get_integer("diagnostics", "max_size"), 4096);

  Config_reporter reporter;
  auto            chapter = reporter.produce_chapter();

  EXPECT_EQ(chapter.get_title(), "Configuration");
  const auto &dict = std::get<Chapter_dictionary>(chapter.get_content());
  EXPECT_THAT(dict, Contains(Pair("diagnostics:app_name", "demo")));
  EXPECT_THAT(dict, Contains(Pair("diagnostics:max_size", "4096")));
  EXPECT_THAT(dict, Contains(Pair("file", conf)));

  ::unlink(conf.c_str());
}

TEST_F(Reporters_test, stats_chapter) {
  Stats_cntr cntr("reporters_test:events");
  cntr.add(3);

  Stats_reporter reporter;
  auto           chapter = reporter.produce_chapter();

  EXPECT_EQ(chapter.get_title(), "Statistics");
  EXPECT_THAT(std::get<Chapter_dictionary>(chapter.get_content()), Contains(Pair("reporters_test:events", "3")));
}

TEST_F(Reporters_test, redact_text_and_values) {
  Redact_filter filter({"hunter2", "alice@example.com", ""});
  EXPECT_EQ(filter.get_name(), "redact");

  auto txt = filter.apply(Report_chapter("Logs", std::string("login alice@example.com pwd=hunter2 hunter2\n")));
  EXPECT_EQ(std::get<std::string>(txt.get_content()), "login [REDACTED] pwd=[REDACTED] [REDACTED]\n");

  auto dict = filter.apply(Report_chapter("Prefs", Chapter_dictionary{{"hunter2", "hunter2"}, {"mail", "alice@example.com"}}));
  const auto &d = std::get<Chapter_dictionary>(dict.get_content());
  // Keys are left alone
  EXPECT_THAT(d, Contains(Pair("hunter2", "[REDACTED]")));
  EXPECT_THAT(d, Contains(Pair("mail", "[REDACTED]")));
}

TEST_F(Reporters_test, full_report) {
  Log_store store(options());
  ASSERT_TRUE(store.init(path).ok());
  ASSERT_TRUE(store.append("token=s3cr3t\n").ok());

  Report_compiler compiler("demo - Diagnostics Report");
  compiler.add_reporter(std::make_shared<Host_reporter>(store, "demo"));
  compiler.add_reporter(std::make_shared<Logs_reporter>(store));
  compiler.add_reporter(std::make_shared<Config_reporter>());
  compiler.add_reporter(std::make_shared<Stats_reporter>());
  compiler.add_filter(std::make_shared<Redact_filter>(std::vector<std::string>{"s3cr3t"}));

  auto html = compiler.compile().get_html();

  EXPECT_THAT(html, HasSubstr("token=[REDACTED]"));
  EXPECT_THAT(html, Not(HasSubstr("s3cr3t")));

  auto host  = html.find("id=\"system-metadata\"");
  auto logs  = html.find("id=\"logs\"");
  auto conf  = html.find("id=\"configuration\"");
  auto stats = html.find("id=\"statistics\"");
  ASSERT_NE(host, std::string::npos);
  ASSERT_NE(logs, std::string::npos);
  ASSERT_NE(conf, std::string::npos);
  ASSERT_NE(stats, std::string::npos);
  EXPECT_LT(host, logs);
  EXPECT_LT(logs, conf);
  EXPECT_LT(conf, stats);
}
