// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <thread>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "snippets.hpp"
#include "stats.hpp"

// Size bounded, append only log file.
//
// All file accesses run on a single worker thread owned by the store, in the
// order they were requested. append() only enqueues. read_all(), flush(),
// size(), clear() and last_error() block until the worker executes them, so
// they observe every append issued before them.
//
// Once the file grows over max_size, complete lines are dropped from the head
// until it is at most max_size - trim_size bytes.
class Log_store {
public:
  struct Session_info {
    std::string app_version = "1.0";
    std::string app_build   = "1";
  };

  struct Options {
    std::string  name                = "log_store";  // Prefix for the stats
    uint64_t     max_size            = 2 * MiB;
    uint64_t     trim_size           = 100 * KiB;
    uint64_t     min_free_space      = 500 * MiB;  // 0 disables the check
    int          file_creation_limit = 2;
    Session_info session;
  };

  Log_store();
  explicit Log_store(const Options &o);
  ~Log_store();

  Log_store(const Log_store &)            = delete;
  Log_store &operator=(const Log_store &) = delete;

  // Opens (or creates) the file and queues the session marker.
  // FailedPrecondition if called twice.
  absl::Status init(const std::string &p);

  // FailedPrecondition before init. Write failures are never reported here,
  // they land in last_error()
  absl::Status append(std::string text);

  // Empty when the file is missing (after clear() and before the next append)
  absl::StatusOr<std::string> read_all();
  absl::Status                clear();
  absl::Status                flush();
  absl::StatusOr<uint64_t>    size();

  // Last failure seen by the worker (recreate, write or trim). OK if none
  absl::Status last_error();

  [[nodiscard]] bool               is_ready() const { return ready.load(std::memory_order_acquire); }
  [[nodiscard]] const std::string &get_path() const { return path; }
  [[nodiscard]] const Options     &get_options() const { return opt; }

private:
  using Task = std::function<void()>;

  const Options opt;
  std::string   path;

  std::atomic<bool> initialized;
  std::atomic<bool> ready;

  // Worker only
  uint64_t     current_size;
  int          file_creation_count;
  absl::Status last_status;

  Stats_cntr nAppends;
  Stats_cntr nAppendBytes;
  Stats_cntr nDropLowSpace;
  Stats_cntr nDropNotReady;
  Stats_cntr nRecreate;
  Stats_cntr nWriteErrors;
  Stats_cntr nTrims;
  Stats_cntr nTrimErrors;
  Stats_cntr nTrimmedBytes;
  Stats_avg  nTrimBatch;   // bytes dropped per trim
  Stats_max  nQueueDepth;  // pending tasks after each post

  absl::Mutex      mu;
  std::deque<Task> tasks ABSL_GUARDED_BY(mu);
  bool             stopping ABSL_GUARDED_BY(mu);

  std::thread worker;

  bool has_work() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu) { return stopping || !tasks.empty(); }

  void run();
  void post(Task t);
  void run_sync(const Task &t);

  void         start_session();
  void         write_entry(const std::string &text, int attempt);
  void         trim_if_needed();
  bool         has_free_space() const;
  absl::Status create_file_if_necessary();
};
