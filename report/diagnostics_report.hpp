// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/statusor.h"

// Compiled report, ready to be attached or written to disk
class Diagnostics_report {
private:
  const std::string          filename;
  const std::string          html;
  const std::vector<uint8_t> data;

public:
  static constexpr const char *default_filename = "Diagnostics-Report.html";
  static constexpr const char *mime_type        = "text/html";

  explicit Diagnostics_report(std::string h, std::string f = default_filename);

  [[nodiscard]] const std::string          &get_filename() const { return filename; }
  [[nodiscard]] const std::string          &get_html() const { return html; }
  [[nodiscard]] const std::vector<uint8_t> &get_data() const { return data; }
  [[nodiscard]] const char                 *get_mime_type() const { return mime_type; }

  // Creates folder (and its parents) if needed. Returns the path written
  absl::StatusOr<std::string> save(const std::string &folder) const;
};
