// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#include "report_compiler.hpp"

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "fmt/format.h"
#include "iassert.hpp"

Report_compiler::Report_compiler(std::string t) : title(std::move(t)) {}

void Report_compiler::add_reporter(std::shared_ptr<Reporter> r) {
  I(r);
  reporters.emplace_back(std::move(r));
}

void Report_compiler::add_filter(std::shared_ptr<Report_filter> f) {
  I(f);
  filters.emplace_back(std::move(f));
}

std::vector<Report_chapter> Report_compiler::produce_chapters() const {
  std::vector<Report_chapter> chapters;
  chapters.reserve(reporters.size());

  absl::flat_hash_set<std::string> anchors;

  for (const auto &r : reporters) {
    auto chapter = r->produce_chapter();

    for (const auto &f : filters) {
      chapter = f->apply(std::move(chapter));
      chapter.add_applied_filter(f->get_name());
    }

    // Anchors must be unique for the menu links to work
    if (anchors.contains(chapter.get_anchor())) {
      auto base = chapter.get_title();
      int  n    = 2;
      while (anchors.contains(Report_chapter::anchor_of(fmt::format("{} ({})", base, n)))) {
        ++n;
      }
      chapter.set_title(fmt::format("{} ({})", base, n));
    }
    anchors.insert(chapter.get_anchor());

    chapters.emplace_back(std::move(chapter));
  }

  return chapters;
}

std::string Report_compiler::header() const {
  return absl::StrCat("<head><title>",
                      html_escape(title),
                      "</title>",
                      style(),
                      "<meta charset=\"utf-8\">",
                      "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">",
                      "</head>");
}

std::string Report_compiler::menu(const std::vector<Report_chapter> &chapters) const {
  std::string html = "<aside class=\"nav-container\"><nav><ul>";
  for (const auto &c : chapters) {
    absl::StrAppend(&html, "<li><a href=\"#", html_escape(c.get_anchor()), "\">", html_escape(c.get_title()), "</a></li>");
  }
  absl::StrAppend(&html, "</ul></nav></aside>");

  return html;
}

std::string Report_compiler::main_content(const std::vector<Report_chapter> &chapters) const {
  std::string html = absl::StrCat("<div class=\"main-content\"><header><h1>", html_escape(title), "</h1></header>");
  for (const auto &c : chapters) {
    absl::StrAppend(&html, c.html());
  }
  absl::StrAppend(&html, "</div>");

  return html;
}

Diagnostics_report Report_compiler::compile() const {
  auto chapters = produce_chapters();

  auto html = absl::StrCat("<html>",
                           header(),
                           "<body><main class=\"container\">",
                           menu(chapters),
                           main_content(chapters),
                           "</main><footer></footer></body></html>");

  return Diagnostics_report(std::move(html));
}

const char *Report_compiler::style() {
  return "<style>"
         "body{font-family:-apple-system,BlinkMacSystemFont,\"Segoe UI\",Roboto,Helvetica,Arial,sans-serif;"
         "-webkit-font-smoothing:antialiased;font-size:1em;line-height:1.3em;margin:50px 50px 20px;color:#17181a}"
         "h1{margin:10px 0 20px;font-weight:400}"
         "h3{display:block;font-weight:400;font-size:20px;margin:0 0 10px}"
         "pre{overflow:scroll}"
         ".container{display:flex;justify-content:space-between;flex-direction:row-reverse;max-width:960px;margin:0 auto}"
         ".main-content{width:calc(100% - 190px)}"
         ".nav-container{width:180px}"
         ".nav-container nav{position:fixed;border-radius:4px}"
         ".nav-container nav ul{margin:0}"
         ".nav-container nav ul li{margin-bottom:5px;display:block}"
         ".nav-container nav ul li a{font-size:14px;color:#444;text-decoration:none}"
         ".nav-container nav ul li a:hover{color:#000;text-decoration:underline}"
         ".chapter{position:relative;margin-bottom:20px;padding-bottom:20px;border-bottom:1px solid #ccc}"
         ".chapter:last-child{border-bottom:0}"
         ".chapter .anchor{position:absolute;top:-20px}"
         "table th{text-align:left;padding:0 5px 0 0;font-weight:500}"
         "table td,table th{font-size:14px}"
         "footer{text-align:center;font-size:14px}"
         "@media(max-width:768px){body{margin:20px}.container{margin:0}.main-content{width:100%}.nav-container{display:none}}"
         "@media (prefers-color-scheme:dark){body{background:#111;color:#f7f7f7}"
         ".chapter{border-bottom-color:rgba(255,255,255,.3)}.nav-container nav ul li a{color:rgba(255,255,255,.6)}}"
         "</style>";
}
