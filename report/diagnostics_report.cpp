// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#include "diagnostics_report.hpp"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include "fmt/format.h"

Diagnostics_report::Diagnostics_report(std::string h, std::string f)
    : filename(std::move(f)), html(std::move(h)), data(html.begin(), html.end()) {}

static absl::Status make_dirs(const std::string &folder) {
  size_t pos = 0;
  while (pos != std::string::npos) {
    pos      = folder.find('/', pos + 1);
    auto dir = folder.substr(0, pos);
    if (dir.empty()) {
      continue;
    }

    if (::mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
      return absl::InternalError(fmt::format("could not create folder {}: {}", dir, strerror(errno)));
    }
  }

  struct stat st;
  if (::stat(folder.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
    return absl::FailedPreconditionError(fmt::format("{} is not a folder", folder));
  }

  return absl::OkStatus();
}

absl::StatusOr<std::string> Diagnostics_report::save(const std::string &folder) const {
  if (folder.empty()) {
    return absl::InvalidArgumentError("empty report folder");
  }

  auto st = make_dirs(folder);
  if (!st.ok()) {
    return st;
  }

  auto path = folder.back() == '/' ? folder + filename : fmt::format("{}/{}", folder, filename);

  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    return absl::InternalError(fmt::format("could not create {}: {}", path, strerror(errno)));
  }

  size_t done = 0;
  while (done < data.size()) {
    auto sz = ::write(fd, data.data() + done, data.size() - done);
    if (sz < 0) {
      if (errno == EINTR) {
        continue;
      }
      auto err = absl::InternalError(fmt::format("could not write {}: {}", path, strerror(errno)));
      ::close(fd);
      return err;
    }
    done += sz;
  }

  if (::close(fd) != 0) {
    return absl::InternalError(fmt::format("could not close {}: {}", path, strerror(errno)));
  }

  return path;
}
