// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#include "log_store.hpp"

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include "absl/synchronization/notification.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "fmt/format.h"
#include "host.hpp"
#include "iassert.hpp"

static absl::Status errno_error(const std::string &what, const std::string &file) {
  return absl::InternalError(fmt::format("{} {}: {}", what, file, strerror(errno)));
}

static absl::StatusOr<std::string> read_file(const std::string &file) {
  int fd = ::open(file.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    if (errno == ENOENT) {
      return absl::NotFoundError(fmt::format("log file {} does not exist", file));
    }
    return errno_error("could not open", file);
  }

  std::string data;
  struct stat st;
  if (fstat(fd, &st) == 0 && st.st_size > 0) {
    data.reserve(st.st_size);
  }

  char buf[64 * 1024];
  while (true) {
    auto sz = ::read(fd, buf, sizeof(buf));
    if (sz < 0) {
      if (errno == EINTR) {
        continue;
      }
      auto err = errno_error("could not read", file);
      ::close(fd);
      return err;
    }
    if (sz == 0) {
      break;
    }
    data.append(buf, sz);
  }

  ::close(fd);
  return data;
}

static absl::Status write_all(int fd, const char *data, size_t size, size_t &done) {
  done = 0;
  while (done < size) {
    auto sz = ::write(fd, data + done, size - done);
    if (sz < 0) {
      if (errno == EINTR) {
        continue;
      }
      return absl::InternalError(fmt::format("write failed: {}", strerror(errno)));
    }
    done += sz;
  }
  return absl::OkStatus();
}

// Replace file with data[offset..] without ever exposing a partial file
static absl::Status replace_file(const std::string &file, const std::string &data, size_t offset) {
  auto tmp = fmt::format("{}.tmp", file);

  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    return errno_error("could not create", tmp);
  }

  size_t done;
  auto   st = write_all(fd, data.data() + offset, data.size() - offset, done);
  if (st.ok() && ::fsync(fd) != 0) {
    st = errno_error("could not sync", tmp);
  }
  ::close(fd);

  if (st.ok() && ::rename(tmp.c_str(), file.c_str()) != 0) {
    st = errno_error("could not rename over", file);
  }

  if (!st.ok()) {
    ::unlink(tmp.c_str());
  }

  return st;
}

Log_store::Log_store() : Log_store(Options()) {}

Log_store::Log_store(const Options &o)
    : opt(o)
    , initialized(false)
    , ready(false)
    , current_size(0)
    , file_creation_count(0)
    , nAppends(fmt::format("{}:appends", o.name))
    , nAppendBytes(fmt::format("{}:append_bytes", o.name))
    , nDropLowSpace(fmt::format("{}:dropped_low_space", o.name))
    , nDropNotReady(fmt::format("{}:dropped_not_ready", o.name))
    , nRecreate(fmt::format("{}:recreated", o.name))
    , nWriteErrors(fmt::format("{}:write_errors", o.name))
    , nTrims(fmt::format("{}:trims", o.name))
    , nTrimErrors(fmt::format("{}:trim_errors", o.name))
    , nTrimmedBytes(fmt::format("{}:trimmed_bytes", o.name))
    , nTrimBatch(fmt::format("{}:trim_batch", o.name))
    , nQueueDepth(fmt::format("{}:queue_depth", o.name))
    , stopping(false) {
  I(opt.trim_size < opt.max_size);
  I(opt.file_creation_limit >= 0);

  worker = std::thread(&Log_store::run, this);
}

Log_store::~Log_store() {
  {
    absl::MutexLock lock(&mu);
    stopping = true;
  }

  // Pending appends are written before the worker exits
  worker.join();
}

void Log_store::run() {
  while (true) {
    Task task;
    {
      absl::MutexLock lock(&mu);
      mu.Await(absl::Condition(this, &Log_store::has_work));
      if (tasks.empty()) {
        return;  // stopping and drained
      }
      task = std::move(tasks.front());
      tasks.pop_front();
    }
    task();
  }
}

void Log_store::post(Task t) {
  absl::MutexLock lock(&mu);
  tasks.emplace_back(std::move(t));
  nQueueDepth.sample(tasks.size());
}

void Log_store::run_sync(const Task &t) {
  if (std::this_thread::get_id() == worker.get_id()) {
    t();
    return;
  }

  absl::Notification done;
  post([&t, &done]() {
    t();
    done.Notify();
  });
  done.WaitForNotification();
}

absl::Status Log_store::init(const std::string &p) {
  bool expected = false;
  if (!initialized.compare_exchange_strong(expected, true)) {
    return absl::FailedPreconditionError(fmt::format("log store already initialized with {}", path));
  }

  path = p;

  absl::Status st;
  run_sync([this, &st]() {
    st = create_file_if_necessary();
    if (!st.ok()) {
      return;
    }

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
      st = errno_error("could not open", path);
      return;
    }
    auto end = ::lseek(fd, 0, SEEK_END);
    if (end < 0) {
      st = errno_error("could not seek", path);
      ::close(fd);
      return;
    }
    ::close(fd);

    current_size = static_cast<uint64_t>(end);
  });

  if (!st.ok()) {
    initialized.store(false);
    return st;
  }

  ready.store(true, std::memory_order_release);
  start_session();

  return absl::OkStatus();
}

void Log_store::start_session() {
  post([this]() {
    auto date = absl::FormatTime("%Y-%m-%d %H:%M:%S", absl::Now(), absl::UTCTimeZone());

    auto message = fmt::format("{}\nSystem: {} {}\nLocale: {}\nTimezone: {}\nVersion: {} ({})\n\n",
                               date,
                               Host::os_name(),
                               Host::os_version(),
                               Host::locale(),
                               Host::timezone(),
                               opt.session.app_version,
                               opt.session.app_build);

    if (current_size == 0) {
      write_entry(message, 0);
    } else {
      write_entry(fmt::format("\n\n---\n\n{}", message), 0);
    }
  });
}

absl::Status Log_store::append(std::string text) {
  if (unlikely(!is_ready())) {
    nDropNotReady.inc();
    return absl::FailedPreconditionError("log store is not ready, call init first");
  }

  post([this, t = std::move(text)]() { write_entry(t, 0); });

  return absl::OkStatus();
}

absl::StatusOr<std::string> Log_store::read_all() {
  if (!is_ready()) {
    return absl::FailedPreconditionError("log store is not ready, call init first");
  }

  absl::StatusOr<std::string> data;
  run_sync([this, &data]() {
    data = read_file(path);
    if (absl::IsNotFound(data.status())) {
      data = std::string();  // cleared or deleted, nothing logged since
    }
  });

  return data;
}

absl::Status Log_store::clear() {
  if (!is_ready()) {
    return absl::FailedPreconditionError("log store is not ready, call init first");
  }

  absl::Status st;
  run_sync([this, &st]() {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
      st = errno_error("could not remove", path);
      return;
    }
    current_size        = 0;
    file_creation_count = 0;
  });

  return st;
}

absl::Status Log_store::flush() {
  if (!is_ready()) {
    return absl::FailedPreconditionError("log store is not ready, call init first");
  }

  run_sync([]() {});

  return absl::OkStatus();
}

absl::StatusOr<uint64_t> Log_store::size() {
  if (!is_ready()) {
    return absl::FailedPreconditionError("log store is not ready, call init first");
  }

  uint64_t sz = 0;
  run_sync([this, &sz]() { sz = current_size; });

  return sz;
}

absl::Status Log_store::last_error() {
  absl::Status st;
  run_sync([this, &st]() { st = last_status; });

  return st;
}

absl::Status Log_store::create_file_if_necessary() {
  struct stat st;
  if (::stat(path.c_str(), &st) == 0) {
    return absl::OkStatus();
  }

  if (file_creation_count > opt.file_creation_limit) {
    return absl::FailedPreconditionError(
        fmt::format("log file {} was created {} times, giving up", path, file_creation_count));
  }

  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    return errno_error("unable to create the log file", path);
  }
  ::close(fd);

  file_creation_count++;
  current_size = 0;

  return absl::OkStatus();
}

bool Log_store::has_free_space() const {
  if (opt.min_free_space == 0) {
    return true;
  }

  auto space = Host::free_disk_space(path);
  if (!space.ok()) {
    return true;  // let the write itself fail if the filesystem is gone
  }

  return *space > opt.min_free_space;
}

void Log_store::write_entry(const std::string &text, int attempt) {
  // Running out of disk would crash the host application somewhere else
  if (!has_free_space()) {
    nDropLowSpace.inc();
    return;
  }

  int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
  if (fd < 0) {
    // The file can vanish at runtime (e.g. created too early in a sandboxed
    // container). Recreate it and retry once
    if (errno != ENOENT || attempt > 0) {
      last_status = errno_error("could not reopen the log file", path);
      nWriteErrors.inc();
      return;
    }

    auto st = create_file_if_necessary();
    if (!st.ok()) {
      last_status = st;
      nWriteErrors.inc();
      return;
    }
    nRecreate.inc();

    write_entry(text, attempt + 1);
    return;
  }

  size_t done;
  auto   st = write_all(fd, text.data(), text.size(), done);
  ::close(fd);

  current_size += done;
  nAppendBytes += done;

  if (!st.ok()) {
    last_status = absl::InternalError(fmt::format("{} {}", st.message(), path));
    nWriteErrors.inc();
  } else {
    nAppends.inc();
  }

  trim_if_needed();
}

void Log_store::trim_if_needed() {
  if (current_size <= opt.max_size) {
    return;
  }

  auto data = read_file(path);
  if (!data.ok() || data->empty()) {
    // Try again on the next append
    last_status = data.ok() ? absl::DataLossError(fmt::format("log file {} is empty while trimming", path)) : data.status();
    nTrimErrors.inc();
    return;
  }

  current_size = data->size();

  const uint64_t target = opt.max_size > opt.trim_size ? opt.max_size - opt.trim_size : 0;

  size_t position = 0;
  while ((current_size - position) > target) {
    auto nl = data->find('\n', position);
    if (nl == std::string::npos) {
      break;
    }
    position = nl + 1;
  }

  if (position == 0) {
    return;
  }

  auto st = replace_file(path, *data, position);
  if (!st.ok()) {
    last_status = st;
    nTrimErrors.inc();
    return;
  }

  current_size -= position;
  nTrims.inc();
  nTrimmedBytes.add(position);
  nTrimBatch.sample(position);
}
