// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#pragma once

#include <exception>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/time/time.h"
#include "log_store.hpp"

struct Source_location {
  const char *file;
  const char *function;
  int         line;
};

#define DIAG_HERE Source_location{__FILE__, __func__, __LINE__}

// Formats log lines on the calling thread and hands them to a Log_store.
// Lines look like:
//   2019-12-02 10:11:12 | EVENT: login | ok | app.cpp:main:L42
class Logger {
private:
  Log_store &store;

  void write(std::string line);

public:
  explicit Logger(Log_store &s) : store(s) {}

  void message(std::string_view text, const Source_location &loc);

  // An empty description is left out
  void error(std::string_view error, std::string_view description, const Source_location &loc);
  void error(const absl::Status &status, std::string_view description, const Source_location &loc);
  void error(const std::exception &e, std::string_view description, const Source_location &loc);

  void event(std::string_view name, std::string_view description, const Source_location &loc);
  void screen(std::string_view name, const Source_location &loc);

  // Console output captured by Console_tap. No timestamp or source
  void system(std::string_view line);

  static std::string format_line(absl::Time when, std::string_view text, const Source_location &loc);
};

#define DIAG_LOG(logger, text)             (logger).message((text), DIAG_HERE)
#define DIAG_ERROR(logger, err, desc)      (logger).error((err), (desc), DIAG_HERE)
#define DIAG_EVENT(logger, name, desc)     (logger).event((name), (desc), DIAG_HERE)
#define DIAG_SCREEN(logger, name)          (logger).screen((name), DIAG_HERE)
