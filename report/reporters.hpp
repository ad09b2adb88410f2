// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#pragma once

#include <string>
#include <vector>

#include "log_store.hpp"
#include "reporter.hpp"

// Whole content of the log store as text
class Logs_reporter : public Reporter {
private:
  Log_store &store;

public:
  explicit Logs_reporter(Log_store &s) : store(s) {}

  Report_chapter produce_chapter() override;
};

// Every configuration value read so far
class Config_reporter : public Reporter {
public:
  Report_chapter produce_chapter() override;
};

class Host_reporter : public Reporter {
private:
  Log_store        &store;
  const std::string app_name;

public:
  Host_reporter(Log_store &s, std::string name) : store(s), app_name(std::move(name)) {}

  Report_chapter produce_chapter() override;
};

class Stats_reporter : public Reporter {
public:
  Report_chapter produce_chapter() override;
};

// Replaces every occurrence of the given strings with [REDACTED]
class Redact_filter : public Report_filter {
private:
  const std::vector<std::string> secrets;

public:
  static constexpr const char *replacement = "[REDACTED]";

  explicit Redact_filter(std::vector<std::string> s);

  std::string    get_name() const override { return "redact"; }
  Report_chapter apply(Report_chapter chapter) const override;
};
