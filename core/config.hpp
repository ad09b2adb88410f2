// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#pragma once

#include <limits>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/synchronization/mutex.h"

#include "toml.hpp"

class Config {
private:
  static inline std::string filename;
  static inline toml::value data;

  static inline absl::Mutex                                  mu;
  static inline std::vector<std::string>                     errors;
  static inline absl::btree_map<std::string, std::string> used;

  static bool check(const std::string &block, const std::string &name);

  static void add_used(const std::string &block, const std::string &name, const std::string &val);

  static const char *get_env(const std::string &block, const std::string &name);

public:
  Config() = delete;  // No object instance. All methods are static

  static void exit_on_error();

  static void init(const std::string &f = "diagnostics.toml");

  static std::string get_string(const std::string &block, const std::string &name,
                                const std::vector<std::string> &allowed = std::vector<std::string>());

  static int get_integer(const std::string &block, const std::string &name, int from = std::numeric_limits<int>::min(),
                         int to = std::numeric_limits<int>::max());

  static size_t      get_array_size(const std::string &block, const std::string &name, size_t max_size = 1024);
  static std::string get_array_string(const std::string &block, const std::string &name, size_t pos);

  static bool get_bool(const std::string &block, const std::string &name);

  static bool has_entry(const std::string &block, const std::string &field);

  static void add_error(const std::string &err);
  static bool has_errors();
  static void clear_errors();

  static std::string get_filename() { return filename; }

  // block:name -> value of every field read so far
  static absl::btree_map<std::string, std::string> get_used();
};
