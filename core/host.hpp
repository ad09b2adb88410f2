// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#pragma once

#include <cstdint>
#include <string>

#include "absl/status/statusor.h"

// Probes of the machine the host application runs on
class Host {
public:
  Host() = delete;  // No object instance. All methods are static

  static std::string os_name();
  static std::string os_version();
  static std::string locale();
  static std::string timezone();

  // Bytes available to unprivileged users on the filesystem holding path.
  // path may be a file that does not exist yet, its directory is used then
  static absl::StatusOr<uint64_t> free_disk_space(const std::string &path);

  // Set by the test harness (DIAGNOSTICS_TEST_RUN)
  static bool is_running_tests();

  // Built for a target where dup2 on the console is not reliable
  static constexpr bool is_simulated_target() {
#ifdef DIAGNOSTICS_SIMULATED_TARGET
    return true;
#else
    return false;
#endif
  }
};
