// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#include "report_chapter.hpp"

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "iassert.hpp"

std::string html_escape(std::string_view txt) {
  return absl::StrReplaceAll(txt,
                             {
                                 {"&", "&amp;"},
                                 {"<", "&lt;"},
                                 {">", "&gt;"},
                                 {"\"", "&quot;"},
                                 {"'", "&#39;"},
                             });
}

Report_chapter::Report_chapter(std::string t, Chapter_content c, bool show)
    : title(std::move(t)), content(std::move(c)), show_title(show) {}

Report_chapter::Report_chapter(std::string t, Chapter_content c, Chapter_formatter f, bool show)
    : title(std::move(t)), content(std::move(c)), formatter(std::move(f)), show_title(show) {
  I(formatter != nullptr);
}

std::string Report_chapter::anchor_of(std::string_view txt) {
  auto anchor = absl::AsciiStrToLower(txt);
  for (auto &c : anchor) {
    if (c == ' ') {
      c = '-';
    }
  }
  return anchor;
}

void Report_chapter::transform_text(const std::function<std::string(const std::string &)> &fn) {
  if (auto *txt = std::get_if<std::string>(&content)) {
    *txt = fn(*txt);
    return;
  }

  for (auto &[key, value] : std::get<Chapter_dictionary>(content)) {
    value = fn(value);
  }
}

static std::string content_html(const Chapter_content &content) {
  if (const auto *txt = std::get_if<std::string>(&content)) {
    return absl::StrCat("<pre>", html_escape(*txt), "</pre>");
  }

  std::string html = "<table>";
  for (const auto &[key, value] : std::get<Chapter_dictionary>(content)) {
    absl::StrAppend(&html, "<tr><th>", html_escape(key), "</th><td>", html_escape(value), "</td></tr>");
  }
  absl::StrAppend(&html, "</table>");

  return html;
}

std::string Report_chapter::html() const {
  std::string html = absl::StrCat("<div class=\"chapter\"><span class=\"anchor\" id=\"", html_escape(get_anchor()), "\"></span>");

  if (show_title) {
    absl::StrAppend(&html, "<h3>", html_escape(title), "</h3>");
  }

  absl::StrAppend(&html, "<div class=\"chapter-content\">");
  if (formatter) {
    absl::StrAppend(&html, formatter(content));
  } else {
    absl::StrAppend(&html, content_html(content));
  }
  absl::StrAppend(&html, "</div></div>");

  return html;
}
