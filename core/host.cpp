// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#include "host.hpp"

#include <errno.h>
#include <string.h>
#include <sys/statvfs.h>
#include <sys/utsname.h>
#include <time.h>

#include <cstdlib>

#include "absl/status/status.h"
#include "fmt/format.h"

std::string Host::os_name() {
  struct utsname u;
  if (uname(&u) != 0) {
    return "unknown";
  }
  return u.sysname;
}

std::string Host::os_version() {
  struct utsname u;
  if (uname(&u) != 0) {
    return "unknown";
  }
  return u.release;
}

std::string Host::locale() {
  for (const char *var : {"LC_ALL", "LC_MESSAGES", "LANG"}) {
    const char *e = getenv(var);
    if (e && *e) {
      std::string l{e};
      auto        pos = l.find('.');  // en_US.UTF-8 -> en_US
      if (pos != std::string::npos) {
        l.resize(pos);
      }
      return l;
    }
  }

  return "C";
}

std::string Host::timezone() {
  time_t    now = time(nullptr);
  struct tm t;
  if (localtime_r(&now, &t) == nullptr || t.tm_zone == nullptr) {
    return "";
  }
  return t.tm_zone;
}

absl::StatusOr<uint64_t> Host::free_disk_space(const std::string &path) {
  std::string dir = path;

  struct statvfs st;
  while (statvfs(dir.c_str(), &st) != 0) {
    if (errno != ENOENT || dir == "." || dir == "/") {
      return absl::InternalError(fmt::format("statvfs {} failed: {}", dir, strerror(errno)));
    }
    auto pos = dir.rfind('/');
    if (pos == std::string::npos) {
      dir = ".";
    } else if (pos == 0) {
      dir = "/";
    } else {
      dir.resize(pos);
    }
  }

  return static_cast<uint64_t>(st.f_bavail) * static_cast<uint64_t>(st.f_frsize);
}

bool Host::is_running_tests() { return getenv("DIAGNOSTICS_TEST_RUN") != nullptr; }
