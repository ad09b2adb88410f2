// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "console_tap.hpp"
#include "log_store.hpp"
#include "logger.hpp"

// Wires the log store, the logger and the console tap from the configuration
// and runs one command line request against them.
class BootLoader {
private:
  static inline std::string              command;
  static inline std::vector<std::string> args;

  static inline std::string              app_name;
  static inline std::string              log_file;
  static inline std::string              report_dir;
  static inline bool                     capture_console = false;
  static inline std::vector<std::string> redact;
  static inline Log_store::Options       store_options;

  static inline std::unique_ptr<Log_store>   store;
  static inline std::unique_ptr<Logger>      logger;
  static inline std::unique_ptr<Console_tap> tap;

  static void parse_args(int argc, const char **argv, std::string &conf_file);
  static void read_config();
  static void check();

public:
  BootLoader() = delete;  // No object instance. All methods are static

  static void plug(int argc, const char **argv);
  static void boot();
  static int  run();
  static void unboot();
  static void unplug();

  // Compiles the default reporters and saves the document into folder
  static absl::StatusOr<std::string> report(const std::string &folder);

  static void usage();
};
