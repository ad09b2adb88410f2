// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#pragma once

#include <string>

#include "report_chapter.hpp"

// Produces one chapter of a diagnostics report
class Reporter {
public:
  virtual ~Reporter() = default;

  virtual Report_chapter produce_chapter() = 0;
};

// Rewrites a chapter before it is rendered (redaction, trimming...)
class Report_filter {
public:
  virtual ~Report_filter() = default;

  virtual std::string    get_name() const                        = 0;
  virtual Report_chapter apply(Report_chapter chapter) const = 0;
};
