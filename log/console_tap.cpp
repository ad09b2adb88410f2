// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#include "console_tap.hpp"

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>

#include "fmt/format.h"
#include "host.hpp"
#include "iassert.hpp"
#include "snippets.hpp"

Console_tap::Console_tap(Line_sink s) : Console_tap(std::move(s), Options()) {}

Console_tap::Console_tap(Line_sink s, const Options &o)
    : sink(std::move(s))
    , opt(o)
    , pipe_rd(-1)
    , pipe_wr(-1)
    , echo_fd(-1)
    , active(false)
    , nLines(fmt::format("{}:lines", o.name))
    , nBytes(fmt::format("{}:bytes", o.name))
    , nInvalid(fmt::format("{}:invalid_utf8", o.name))
    , nEchoErrors(fmt::format("{}:echo_errors", o.name)) {
  I(sink != nullptr);
  I(opt.max_line > 0);
}

Console_tap::~Console_tap() { stop(); }

void Console_tap::release_fds() {
  for (auto fd : saved_fds) {
    ::close(fd);
  }
  saved_fds.clear();

  for (auto *fd : {&pipe_rd, &pipe_wr, &echo_fd}) {
    if (*fd >= 0) {
      ::close(*fd);
      *fd = -1;
    }
  }
}

absl::Status Console_tap::start() {
  if (active) {
    return absl::FailedPreconditionError("console tap already started");
  }

  if (opt.skip_under_tests && Host::is_running_tests()) {
    return absl::OkStatus();
  }
  if (Host::is_simulated_target()) {
    return absl::OkStatus();
  }

  if (opt.fds.empty()) {
    return absl::InvalidArgumentError("console tap without descriptors to tap");
  }

  int p[2];
  if (::pipe2(p, O_CLOEXEC) != 0) {
    return absl::InternalError(fmt::format("console tap pipe failed: {}", strerror(errno)));
  }
  pipe_rd = p[0];
  pipe_wr = p[1];

  // Everything captured is copied back to where the first descriptor pointed
  echo_fd = ::fcntl(opt.fds[0], F_DUPFD_CLOEXEC, 0);
  if (echo_fd < 0) {
    auto err = absl::InternalError(fmt::format("console tap dup of fd {} failed: {}", opt.fds[0], strerror(errno)));
    release_fds();
    return err;
  }

  for (auto fd : opt.fds) {
    auto saved = ::fcntl(fd, F_DUPFD_CLOEXEC, 0);
    if (saved < 0) {
      auto err = absl::InternalError(fmt::format("console tap dup of fd {} failed: {}", fd, strerror(errno)));
      release_fds();
      return err;
    }
    saved_fds.push_back(saved);
  }

  fflush(nullptr);

  for (size_t i = 0; i < opt.fds.size(); ++i) {
    if (::dup2(pipe_wr, opt.fds[i]) < 0) {
      auto err = absl::InternalError(fmt::format("console tap dup2 on fd {} failed: {}", opt.fds[i], strerror(errno)));
      for (size_t j = 0; j < i; ++j) {
        auto rc = ::dup2(saved_fds[j], opt.fds[j]);
        I(rc == opt.fds[j]);
        (void)rc;
      }
      release_fds();
      return err;
    }
  }

  active = true;
  reader = std::thread(&Console_tap::run, this);

  return absl::OkStatus();
}

void Console_tap::stop() {
  if (!active) {
    return;
  }

  fflush(nullptr);

  for (size_t i = 0; i < opt.fds.size(); ++i) {
    auto rc = ::dup2(saved_fds[i], opt.fds[i]);
    I(rc == opt.fds[i]);
    (void)rc;
  }

  // Last write end of the pipe, the reader sees EOF once it drained it
  ::close(pipe_wr);
  pipe_wr = -1;

  reader.join();

  release_fds();
  active = false;
}

void Console_tap::run() {
  char buf[4096];

  while (true) {
    auto sz = ::read(pipe_rd, buf, sizeof(buf));
    if (sz < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (sz == 0) {
      break;
    }

    nBytes.add(sz);

    // The console first, so external tooling keeps seeing the output
    ssize_t done = 0;
    while (done < sz) {
      auto w = ::write(echo_fd, buf + done, sz - done);
      if (w < 0) {
        if (errno == EINTR) {
          continue;
        }
        nEchoErrors.inc();
        break;
      }
      done += w;
    }

    consume(buf, sz);
  }

  flush_partial();
}

void Console_tap::consume(const char *data, size_t size) {
  partial.append(data, size);

  if (!is_valid_utf8(partial, true)) {
    // Not text. Still on the console, but nothing to log
    nInvalid.inc();
    partial.clear();
    return;
  }

  size_t start = 0;
  while (true) {
    auto nl = partial.find('\n', start);
    if (nl == std::string::npos) {
      break;
    }

    std::string_view line(partial.data() + start, nl - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    sink(line);
    nLines.inc();

    start = nl + 1;
  }
  partial.erase(0, start);

  while (partial.size() >= opt.max_line) {
    // Cut on a character boundary, the head must be valid text on its own
    size_t cut = opt.max_line;
    while (cut > 0 && !is_valid_utf8(std::string_view(partial.data(), cut))) {
      --cut;
    }
    if (cut == 0) {
      // max_line shorter than the first character, keep it whole
      cut = opt.max_line;
      while (cut < partial.size() && !is_valid_utf8(std::string_view(partial.data(), cut))) {
        ++cut;
      }
      if (!is_valid_utf8(std::string_view(partial.data(), cut))) {
        break;  // wait for the rest of the sequence
      }
    }

    sink(std::string_view(partial.data(), cut));
    nLines.inc();
    partial.erase(0, cut);
  }
}

void Console_tap::flush_partial() {
  if (partial.empty()) {
    return;
  }

  if (is_valid_utf8(partial)) {
    sink(partial);
    nLines.inc();
  } else {
    nInvalid.inc();
  }
  partial.clear();
}
