// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#pragma once

#include <cstdint>
#include <string>

#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "iassert.hpp"

using Stats_fields = absl::btree_map<std::string, std::string>;

// Named statistics. Any thread may update them; they are collected by
// Stats::report_all() when a diagnostics report is built.
class Stats {
private:
  static inline absl::Mutex                               store_mu;
  static inline absl::flat_hash_map<std::string, Stats *> store;

protected:
  const std::string   name;
  mutable absl::Mutex mu;

  void subscribe();
  void unsubscribe();

public:
  explicit Stats(const std::string &n) : name(n){};
  virtual ~Stats();

  Stats(const Stats &)            = delete;
  Stats &operator=(const Stats &) = delete;

  static Stats_fields report_all();

  virtual void report(Stats_fields &fields) const = 0;
};

class Stats_cntr : public Stats {
private:
  int64_t data;

public:
  explicit Stats_cntr(const std::string &format);

  Stats_cntr &operator+=(const int64_t v) {
    add(v);
    return *this;
  }

  void add(const int64_t v, bool en = true) {
    absl::MutexLock lock(&mu);
    data += en ? v : 0;
  }
  void inc(bool en = true) { add(1, en); }

  void report(Stats_fields &fields) const final;
};

class Stats_avg : public Stats {
protected:
  double  data;
  int64_t nData;

public:
  explicit Stats_avg(const std::string &format);

  void sample(const double v, bool en = true);

  void report(Stats_fields &fields) const final;
};

class Stats_max : public Stats {
protected:
  double  maxValue;
  int64_t nData;

public:
  explicit Stats_max(const std::string &format);

  void sample(const double v, bool en = true);

  void report(Stats_fields &fields) const final;
};
