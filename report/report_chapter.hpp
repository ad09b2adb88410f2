// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "absl/container/btree_map.h"

using Chapter_dictionary = absl::btree_map<std::string, std::string>;
using Chapter_content    = std::variant<std::string, Chapter_dictionary>;

// Renders the content of a chapter. The result is inserted as is, so it must
// already be escaped
using Chapter_formatter = std::function<std::string(const Chapter_content &)>;

std::string html_escape(std::string_view txt);

// One titled section of a diagnostics report
class Report_chapter {
private:
  std::string              title;
  Chapter_content          content;
  Chapter_formatter        formatter;
  bool                     show_title;
  std::vector<std::string> applied_filters;

  friend class Report_compiler;

  void set_title(std::string t) { title = std::move(t); }
  void add_applied_filter(std::string name) { applied_filters.emplace_back(std::move(name)); }

public:
  Report_chapter(std::string t, Chapter_content c, bool show = true);
  Report_chapter(std::string t, Chapter_content c, Chapter_formatter f, bool show = true);

  [[nodiscard]] const std::string              &get_title() const { return title; }
  [[nodiscard]] std::string                     get_anchor() const { return anchor_of(title); }
  [[nodiscard]] const Chapter_content          &get_content() const { return content; }
  [[nodiscard]] bool                            is_title_shown() const { return show_title; }
  [[nodiscard]] bool                            has_formatter() const { return formatter != nullptr; }
  [[nodiscard]] const std::vector<std::string> &get_applied_filters() const { return applied_filters; }

  // Rewrites the text, or every value of a dictionary
  void transform_text(const std::function<std::string(const std::string &)> &fn);

  std::string html() const;

  // Lowercase, spaces become '-'
  static std::string anchor_of(std::string_view txt);
};
