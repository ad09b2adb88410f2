// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#include "stats.hpp"

#include <memory>
#include <thread>
#include <vector>

#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class Stats_test : public ::testing::Test {
protected:
  void SetUp() override { Config::clear_errors(); }
  void TearDown() override { Config::clear_errors(); }
};

TEST_F(Stats_test, counter) {
  Stats_cntr cntr("stats_test:cntr");

  EXPECT_EQ(Stats::report_all()["stats_test:cntr"], "0");

  cntr.inc();
  cntr.inc();
  cntr.inc(false);
  cntr += 5;
  cntr.add(-1);
  cntr.add(10, false);

  EXPECT_EQ(Stats::report_all()["stats_test:cntr"], "6");
}

TEST_F(Stats_test, avg_and_max) {
  Stats_avg avg("stats_test:avg");
  Stats_max max("stats_test:max");

  auto empty = Stats::report_all();
  EXPECT_EQ(empty["stats_test:avg"], "n=0 v=0.00");
  EXPECT_EQ(empty["stats_test:max"], "max=0 n=0");

  avg.sample(2);
  avg.sample(4);
  avg.sample(100, false);
  max.sample(7);
  max.sample(3);
  max.sample(50, false);

  auto fields = Stats::report_all();
  EXPECT_EQ(fields["stats_test:avg"], "n=2 v=3.00");
  EXPECT_EQ(fields["stats_test:max"], "max=7 n=2");
}

TEST_F(Stats_test, unsubscribe_on_destruction) {
  {
    Stats_cntr cntr("stats_test:scoped");
    EXPECT_EQ(Stats::report_all().count("stats_test:scoped"), 1);
  }
  EXPECT_EQ(Stats::report_all().count("stats_test:scoped"), 0);
}

TEST_F(Stats_test, duplicate_name_is_a_config_error) {
  Stats_cntr first("stats_test:dup");
  EXPECT_FALSE(Config::has_errors());

  {
    Stats_cntr second("stats_test:dup");
    EXPECT_TRUE(Config::has_errors());
  }

  // The second one must not remove the registration of the first
  first.inc();
  EXPECT_EQ(Stats::report_all()["stats_test:dup"], "1");
}

TEST_F(Stats_test, concurrent_updates) {
  Stats_cntr cntr("stats_test:mt");

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&cntr]() {
      for (int i = 0; i < 1000; ++i) {
        cntr.inc();
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  EXPECT_EQ(Stats::report_all()["stats_test:mt"], "4000");
}
