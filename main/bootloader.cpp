// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#include "bootloader.hpp"

#include <stdlib.h>
#include <string.h>

#include "absl/container/flat_hash_map.h"
#include "config.hpp"
#include "fmt/format.h"
#include "iassert.hpp"
#include "report_compiler.hpp"
#include "reporters.hpp"

// Minimum and maximum number of arguments after each command
static const absl::flat_hash_map<std::string, std::pair<size_t, size_t>> command_args = {
    {"check", {0, 0}},
    {"log", {1, 1}},
    {"error", {1, 2}},
    {"event", {1, 2}},
    {"screen", {1, 1}},
    {"report", {0, 1}},
    {"clear", {0, 0}},
};

void BootLoader::usage() {
  fmt::print(
      "usage: diagnostics [-c conf.toml] <command>\n"
      "  check                        validate the configuration\n"
      "  log <text>                   append a message\n"
      "  error <text> [description]   append an error\n"
      "  event <name> [description]   append an event\n"
      "  screen <name>                append a screen visit\n"
      "  report [folder]              write Diagnostics-Report.html\n"
      "  clear                        empty the log file\n");
}

void BootLoader::parse_args(int argc, const char **argv, std::string &conf_file) {
  command.clear();
  args.clear();

  for (auto i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "-c") == 0) {
      ++i;
      if (i >= argc) {
        fmt::print("after -c, there should be a config file name\n");
        exit(-3);
      }
      conf_file = argv[i];
    } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
      usage();
      exit(0);
    } else if (command.empty()) {
      command = argv[i];
    } else {
      args.emplace_back(argv[i]);
    }
  }

  if (command.empty()) {
    usage();
    exit(-3);
  }

  auto it = command_args.find(command);
  if (it == command_args.end()) {
    fmt::print("unknown {} command\n", command);
    usage();
    exit(-3);
  }
  if (args.size() < it->second.first || args.size() > it->second.second) {
    fmt::print("wrong number of arguments for {}\n", command);
    usage();
    exit(-3);
  }
}

void BootLoader::read_config() {
  app_name        = Config::get_string("diagnostics", "app_name");
  log_file        = Config::get_string("diagnostics", "log_file");
  report_dir      = Config::get_string("diagnostics", "report_dir");
  capture_console = Config::get_bool("diagnostics", "capture_console");

  store_options.session.app_version = Config::get_string("diagnostics", "app_version");
  store_options.session.app_build   = Config::get_string("diagnostics", "app_build");

  store_options.max_size  = Config::get_integer("diagnostics", "max_size", 1024);
  store_options.trim_size = Config::get_integer("diagnostics", "trim_size", 0);

  if (Config::has_entry("diagnostics", "min_free_space")) {
    store_options.min_free_space = Config::get_integer("diagnostics", "min_free_space", 0, 1024 * 1024) * MiB;
  }

  redact.clear();
  if (Config::has_entry("diagnostics", "redact")) {
    auto n = Config::get_array_size("diagnostics", "redact");
    for (auto i = 0u; i < n; ++i) {
      redact.emplace_back(Config::get_array_string("diagnostics", "redact", i));
    }
  }
}

void BootLoader::check() {
  if (store_options.trim_size >= store_options.max_size) {
    Config::add_error(fmt::format("diagnostics trim_size:{} should be smaller than max_size:{}",
                                  store_options.trim_size,
                                  store_options.max_size));
  }

  if (log_file.empty()) {
    Config::add_error("diagnostics log_file can not be empty");
  }
}

void BootLoader::plug(int argc, const char **argv) {
  // Before boot

  std::string conf_file = "diagnostics.toml";

  parse_args(argc, argv, conf_file);

  Config::init(conf_file);

  read_config();
  check();

  Config::exit_on_error();

  if (command == "check") {
    fmt::print("check success\n");
    exit(0);
  }
}

void BootLoader::boot() {
  Config::exit_on_error();

  store = std::make_unique<Log_store>(store_options);

  auto st = store->init(log_file);
  if (!st.ok()) {
    Config::add_error(fmt::format("could not open the log file: {}", st.ToString()));
    Config::exit_on_error();
  }

  logger = std::make_unique<Logger>(*store);

  if (capture_console) {
    tap = std::make_unique<Console_tap>([](std::string_view line) { logger->system(line); });

    st = tap->start();
    if (!st.ok()) {
      // Logging still works without the console
      fmt::print(stderr, "WARNING: console capture disabled: {}\n", st.ToString());
    }
  }
}

absl::StatusOr<std::string> BootLoader::report(const std::string &folder) {
  I(store);

  Report_compiler compiler(fmt::format("{} - Diagnostics Report", app_name));

  compiler.add_reporter(std::make_shared<Host_reporter>(*store, app_name));
  compiler.add_reporter(std::make_shared<Logs_reporter>(*store));
  compiler.add_reporter(std::make_shared<Config_reporter>());
  compiler.add_reporter(std::make_shared<Stats_reporter>());

  if (!redact.empty()) {
    compiler.add_filter(std::make_shared<Redact_filter>(redact));
  }

  return compiler.compile().save(folder);
}

int BootLoader::run() {
  I(logger);

  auto arg = [](size_t i) -> std::string { return i < args.size() ? args[i] : std::string(); };

  if (command == "log") {
    DIAG_LOG(*logger, arg(0));
  } else if (command == "error") {
    DIAG_ERROR(*logger, arg(0), arg(1));
  } else if (command == "event") {
    DIAG_EVENT(*logger, arg(0), arg(1));
  } else if (command == "screen") {
    DIAG_SCREEN(*logger, arg(0));
  } else if (command == "clear") {
    auto st = store->clear();
    if (!st.ok()) {
      fmt::print(stderr, "ERROR: could not clear {}: {}\n", log_file, st.ToString());
      return 1;
    }
  } else if (command == "report") {
    auto path = report(args.empty() ? report_dir : args[0]);
    if (!path.ok()) {
      fmt::print(stderr, "ERROR: could not save the report: {}\n", path.status().ToString());
      return 1;
    }
    fmt::print("Diagnostics Report saved to: {}\n", *path);
  } else {
    I(false);  // parse_args only lets known commands through
    return 1;
  }

  return 0;
}

void BootLoader::unboot() {
  if (tap) {
    tap->stop();
  }

  if (!store) {
    return;
  }

  auto st = store->flush();
  if (st.ok()) {
    st = store->last_error();
  }
  if (!st.ok()) {
    fmt::print(stderr, "WARNING: {}\n", st.ToString());
  }
}

void BootLoader::unplug() {
  // after unboot

  tap.reset();
  logger.reset();
  store.reset();
}
