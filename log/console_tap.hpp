// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#pragma once

#include <unistd.h>

#include <functional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "absl/status/status.h"
#include "stats.hpp"

// Mirrors what the process writes to its console descriptors into a line
// sink. The tapped descriptors are redirected into a pipe; a reader thread
// copies every chunk back to the original console and splits it into lines
// for the sink.
//
// Set up once per process. Not thread safe: start() and stop() must be
// called from the same thread.
class Console_tap {
public:
  using Line_sink = std::function<void(std::string_view line)>;

  struct Options {
    std::string      name             = "console_tap";  // Prefix for the stats
    std::vector<int> fds              = {STDOUT_FILENO, STDERR_FILENO};
    bool             skip_under_tests = true;
    size_t           max_line         = 64 * 1024;  // longer lines are split
  };

  explicit Console_tap(Line_sink s);
  Console_tap(Line_sink s, const Options &o);
  ~Console_tap();

  Console_tap(const Console_tap &)            = delete;
  Console_tap &operator=(const Console_tap &) = delete;

  // OK without tapping anything when running under tests or on a simulated
  // target. Check is_active() to know
  absl::Status start();

  // Restores the descriptors and delivers any pending partial line
  void stop();

  [[nodiscard]] bool is_active() const { return active; }

private:
  const Line_sink sink;
  const Options   opt;

  int              pipe_rd;
  int              pipe_wr;
  int              echo_fd;
  std::vector<int> saved_fds;
  bool             active;

  // Reader thread only
  std::string partial;

  std::thread reader;

  Stats_cntr nLines;
  Stats_cntr nBytes;
  Stats_cntr nInvalid;
  Stats_cntr nEchoErrors;

  void run();
  void consume(const char *data, size_t size);
  void flush_partial();
  void release_fds();
};
