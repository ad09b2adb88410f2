// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#include "bootloader.hpp"

#include <unistd.h>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "config.hpp"
#include "fmt/format.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

using ::testing::HasSubstr;
using ::testing::Not;

class BootLoader_test : public ::testing::Test {
protected:
  std::string dir;
  std::string conf;
  std::string log_file;

  void SetUp() override {
    dir      = fmt::format("{}bootloader_test_{}", ::testing::TempDir(), getpid());
    conf     = dir + ".toml";
    log_file = dir + "_log.txt";
    ::unlink(log_file.c_str());

    std::ofstream f(conf);
    f << "[diagnostics]\n";
    f << "app_name = \"demo\"\n";
    f << "app_version = \"2.0\"\n";
    f << "app_build = \"5\"\n";
    f << "log_file = \"" << log_file << "\"\n";
    f << "report_dir = \"" << dir << "\"\n";
    f << "max_size = 65536\n";
    f << "trim_size = 1024\n";
    f << "min_free_space = 0\n";
    f << "capture_console = false\n";
    f << "redact = [\"hunter2\"]\n";
    f.close();

    Config::clear_errors();
  }

  void TearDown() override {
    ::unlink(conf.c_str());
    ::unlink(log_file.c_str());
    ::unlink(fmt::format("{}/Diagnostics-Report.html", dir).c_str());
    ::rmdir(dir.c_str());
  }

  int run(std::vector<std::string> cmd) const {
    std::vector<const char *> argv = {"diagnostics", "-c", conf.c_str()};
    for (const auto &c : cmd) {
      argv.push_back(c.c_str());
    }

    BootLoader::plug(argv.size(), argv.data());
    BootLoader::boot();
    auto rc = BootLoader::run();
    BootLoader::unboot();
    BootLoader::unplug();

    return rc;
  }

  static std::string read(const std::string &file) {
    std::ifstream     f(file, std::ios::binary);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
  }
};

TEST_F(BootLoader_test, commands_append_to_the_log) {
  EXPECT_EQ(run({"log", "hello"}), 0);
  EXPECT_EQ(run({"error", "oops", "while saving"}), 0);
  EXPECT_EQ(run({"event", "login"}), 0);
  EXPECT_EQ(run({"screen", "Settings"}), 0);

  auto txt = read(log_file);
  EXPECT_THAT(txt, HasSubstr("Version: 2.0 (5)\n"));
  EXPECT_THAT(txt, HasSubstr(" | hello | "));
  EXPECT_THAT(txt, HasSubstr(" | ERROR: oops | while saving | "));
  EXPECT_THAT(txt, HasSubstr(" | EVENT: login | "));
  EXPECT_THAT(txt, HasSubstr(" | SCREEN: Settings | "));
  EXPECT_THAT(txt, HasSubstr("\n\n---\n\n"));
}

TEST_F(BootLoader_test, report_is_saved_and_redacted) {
  EXPECT_EQ(run({"log", "password is hunter2"}), 0);
  EXPECT_EQ(run({"report"}), 0);

  auto html = read(fmt::format("{}/Diagnostics-Report.html", dir));
  EXPECT_THAT(html, HasSubstr("<title>demo - Diagnostics Report</title>"));
  EXPECT_THAT(html, HasSubstr("password is [REDACTED]"));
  EXPECT_THAT(html, Not(HasSubstr("hunter2")));
  EXPECT_THAT(html, HasSubstr("id=\"system-metadata\""));
  EXPECT_THAT(html, HasSubstr("id=\"logs\""));
  EXPECT_THAT(html, HasSubstr("id=\"configuration\""));
  EXPECT_THAT(html, HasSubstr("id=\"statistics\""));
}

TEST_F(BootLoader_test, clear_empties_the_log) {
  EXPECT_EQ(run({"log", "old entry"}), 0);
  EXPECT_EQ(run({"clear"}), 0);

  auto txt = read(log_file);
  EXPECT_THAT(txt, Not(HasSubstr("old entry")));
}

TEST_F(BootLoader_test, unknown_command_exits) {
  std::vector<const char *> argv = {"diagnostics", "-c", conf.c_str(), "nope"};
  EXPECT_EXIT(BootLoader::plug(argv.size(), argv.data()), ::testing::ExitedWithCode(253), "");
}

TEST_F(BootLoader_test, check_validates_the_configuration) {
  std::vector<const char *> argv = {"diagnostics", "-c", conf.c_str(), "check"};
  EXPECT_EXIT(BootLoader::plug(argv.size(), argv.data()), ::testing::ExitedWithCode(0), "");
}
