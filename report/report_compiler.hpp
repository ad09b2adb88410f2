// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "diagnostics_report.hpp"
#include "reporter.hpp"

// Runs the reporters in order, passes each chapter through the filters in
// order and renders a single HTML page with a navigation menu.
class Report_compiler {
private:
  const std::string title;

  std::vector<std::shared_ptr<Reporter>>      reporters;
  std::vector<std::shared_ptr<Report_filter>> filters;

  std::string header() const;
  std::string menu(const std::vector<Report_chapter> &chapters) const;
  std::string main_content(const std::vector<Report_chapter> &chapters) const;

public:
  explicit Report_compiler(std::string t);

  void add_reporter(std::shared_ptr<Reporter> r);
  void add_filter(std::shared_ptr<Report_filter> f);

  [[nodiscard]] const std::string &get_title() const { return title; }

  // Filtered chapters with unique titles, in reporter order
  std::vector<Report_chapter> produce_chapters() const;

  Diagnostics_report compile() const;

  static const char *style();
};
