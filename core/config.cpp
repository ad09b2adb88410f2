// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#include "config.hpp"

#include <strings.h>
#include <unistd.h>

#include <algorithm>
#include <cstdlib>

#include "fmt/format.h"

void Config::init(const std::string &f) {
  filename = f;

  const char *e = getenv("DIAGNOSTICSCONF");
  if (e) {
    filename = e;
  }

  {
    absl::MutexLock lock(&mu);
    used.clear();
  }

  if (access(filename.c_str(), F_OK) == -1) {
    add_error(fmt::format("could not open configuration file named {}", filename));
    exit_on_error();
  }

  data = toml::parse(filename);
}

void Config::exit_on_error() {
  absl::MutexLock lock(&mu);
  if (errors.empty()) {
    return;
  }

  for (const auto &e : errors) {
    fmt::print(stderr, "ERROR:{}\n", e);
  }

  abort();  // Abort no exit to leave a core with the bad configuration state
}

const char *Config::get_env(const std::string &block, const std::string &name) {
  std::string env_var = fmt::format("DIAGNOSTICS_{}_{}", block, name);

  return getenv(env_var.c_str());
}

bool Config::check(const std::string &block, const std::string &name) {
  if (block.empty()) {
    add_error(fmt::format("section is empty for configuration:{}", filename));
    return false;
  }

  if (!data.contains(block)) {
    add_error(fmt::format("section:{} does not exist in configuration:{}", block, filename));
    return false;
  }

  auto sec = toml::find(data, block);
  if (!sec.contains(name)) {
    add_error(fmt::format("section:{} does not have field named {} in configuration:{}", block, name, filename));
    return false;
  }

  return true;
}

std::string Config::get_string(const std::string &block, const std::string &name, const std::vector<std::string> &allowed) {
  std::string val;

  const char *e = get_env(block, name);
  if (e) {
    val = e;
  } else {
    if (!check(block, name)) {
      return "INVALID";
    }

    auto ent = toml::find(data, block, name);
    if (!ent.is_string()) {
      add_error(fmt::format("conf:{} section:{} field:{} is not a string", filename, block, name));
      return "INVALID";
    }
    val = ent.as_string();
  }

  if (!allowed.empty()) {
    for (auto a : allowed) {
      auto same = std::equal(a.cbegin(), a.cend(), val.cbegin(), val.cend(), [](auto c1, auto c2) {
        return std::toupper(c1) == std::toupper(c2);
      });
      if (same) {
        std::transform(a.begin(), a.end(), a.begin(), [](unsigned char c) { return std::tolower(c); });
        add_used(block, name, a);
        return a;
      }
    }

    add_error(fmt::format("conf:{} section:{} field:{} value:{} is not allowed", filename, block, name, val));
    return "INVALID";
  }

  add_used(block, name, val);

  return val;
}

int Config::get_integer(const std::string &block, const std::string &name, int from, int to) {
  int64_t val = 0;

  const char *e = get_env(block, name);
  if (e) {
    val = std::atoll(e);
  } else {
    if (!check(block, name)) {
      return 0;
    }

    auto ent = toml::find(data, block, name);
    if (!ent.is_integer() && !ent.is_floating()) {
      add_error(fmt::format("conf:{} section:{} field:{} is not a integer", filename, block, name));
      return 0;
    }

    if (ent.is_integer())
      val = ent.as_integer();
    else
      val = static_cast<int64_t>(ent.as_floating());
  }

  if (val < from || val > to) {
    add_error(fmt::format("conf:{} section:{} field:{} value:{} is not allowed range ({}..<={})",
                          filename,
                          block,
                          name,
                          val,
                          from,
                          to));
    return 0;
  }

  add_used(block, name, fmt::format("{}", val));

  return static_cast<int>(val);
}

size_t Config::get_array_size(const std::string &block, const std::string &name, size_t max_size) {
  if (!check(block, name)) {
    return 0;
  }

  auto ent = toml::find(data, block, name);
  if (!ent.is_array()) {
    add_error(fmt::format("conf:{} section:{} field:{} is not an array", filename, block, name));
    return 0;
  }

  auto i = ent.as_array().size();
  if (i > max_size) {
    add_error(fmt::format("conf:{} section:{} field:{} has too many entries", filename, block, name));
    return max_size;
  }

  return i;
}

std::string Config::get_array_string(const std::string &block, const std::string &name, size_t pos) {
  if (!check(block, name)) {
    return "INVALID";
  }

  auto ent = toml::find(data, block, name);
  if (!ent.is_array()) {
    add_error(fmt::format("conf:{} section:{} field:{} is not an array", filename, block, name));
    return "INVALID";
  }

  const auto &arr = ent.as_array();
  if (arr.size() <= pos) {
    add_error(fmt::format("conf:{} section:{} field:{} out of bounds {} array of size {}", filename, block, name, pos, arr.size()));
    return "INVALID";
  }

  if (!arr[pos].is_string()) {
    add_error(fmt::format("conf:{} section:{} field:{} array entry is not string", filename, block, name));
    return "INVALID";
  }

  std::string val = arr[pos].as_string();

  add_used(block, fmt::format("{}[{}]", name, pos), val);

  return val;
}

bool Config::get_bool(const std::string &block, const std::string &name) {
  {
    const char *e = get_env(block, name);
    if (e) {
      bool v = strcasecmp(e, "true") == 0;
      add_used(block, name, v ? "true" : "false");
      return v;
    }
  }

  if (!check(block, name)) {
    return false;
  }

  auto ent = toml::find(data, block, name);
  if (!ent.is_boolean()) {
    add_error(fmt::format("conf:{} section:{} field:{} is not a boolean", filename, block, name));
    return false;
  }

  auto val = ent.as_boolean();

  add_used(block, name, val ? "true" : "false");

  return val;
}

bool Config::has_entry(const std::string &block, const std::string &name) {
  if (block.empty()) {
    return false;
  }

  if (get_env(block, name)) {
    return true;
  }

  if (!data.contains(block)) {
    return false;
  }

  auto sec = toml::find(data, block);
  return sec.contains(name);
}

void Config::add_error(const std::string &err) {
  absl::MutexLock lock(&mu);
  errors.emplace_back(err);
}

bool Config::has_errors() {
  absl::MutexLock lock(&mu);
  return !errors.empty();
}

void Config::clear_errors() {
  absl::MutexLock lock(&mu);
  errors.clear();
}

void Config::add_used(const std::string &block, const std::string &name, const std::string &val) {
  absl::MutexLock lock(&mu);
  used[fmt::format("{}:{}", block, name)] = val;
}

absl::btree_map<std::string, std::string> Config::get_used() {
  absl::MutexLock lock(&mu);
  return used;
}
