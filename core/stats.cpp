// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#include "stats.hpp"

#include "config.hpp"
#include "fmt/format.h"

/*********************** Stats */

Stats::~Stats() { unsubscribe(); }

void Stats::subscribe() {
  I(!name.empty());

  absl::MutexLock lock(&store_mu);
  if (store.find(name) != store.end()) {
    Config::add_error(fmt::format("stats is added twice with name [{}]. Use another name", name));
    return;
  }

  store[name] = this;
}

void Stats::unsubscribe() {
  I(!name.empty());

  absl::MutexLock lock(&store_mu);
  auto            it = store.find(name);
  if (it != store.end() && it->second == this) {
    store.erase(it);
  }
}

Stats_fields Stats::report_all() {
  Stats_fields fields;

  absl::MutexLock lock(&store_mu);
  for (const auto &e : store) {
    e.second->report(fields);
  }

  return fields;
}

/*********************** Stats_cntr */

Stats_cntr::Stats_cntr(const std::string &str) : Stats(str) {
  data = 0;

  subscribe();
}

void Stats_cntr::report(Stats_fields &fields) const {
  absl::MutexLock lock(&mu);
  fields[name] = fmt::format("{}", data);
}

/*********************** Stats_avg */

Stats_avg::Stats_avg(const std::string &str) : Stats(str) {
  data  = 0;
  nData = 0;

  subscribe();
}

void Stats_avg::sample(const double v, bool en) {
  absl::MutexLock lock(&mu);
  data += en ? v : 0;
  nData += en ? 1 : 0;
}

void Stats_avg::report(Stats_fields &fields) const {
  absl::MutexLock lock(&mu);
  auto            v = nData ? data / nData : 0.0;

  fields[name] = fmt::format("n={} v={:.2f}", nData, v);
}

/*********************** Stats_max */

Stats_max::Stats_max(const std::string &str) : Stats(str) {
  maxValue = 0;
  nData    = 0;

  subscribe();
}

void Stats_max::sample(const double v, bool en) {
  if (!en) {
    return;
  }
  absl::MutexLock lock(&mu);
  maxValue = v > maxValue ? v : maxValue;
  nData++;
}

void Stats_max::report(Stats_fields &fields) const {
  absl::MutexLock lock(&mu);
  fields[name] = fmt::format("max={} n={}", maxValue, nData);
}
