// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#include "reporters.hpp"

#include "absl/strings/str_replace.h"
#include "config.hpp"
#include "fmt/format.h"
#include "host.hpp"
#include "snippets.hpp"
#include "stats.hpp"

Report_chapter Logs_reporter::produce_chapter() {
  auto content = store.read_all();
  if (!content.ok()) {
    return Report_chapter("Logs", fmt::format("Could not read the logs: {}", content.status().ToString()));
  }

  return Report_chapter("Logs", std::move(*content));
}

Report_chapter Config_reporter::produce_chapter() {
  Chapter_dictionary dict;
  for (const auto &[key, value] : Config::get_used()) {
    dict.emplace(key, value);
  }

  if (!Config::get_filename().empty()) {
    dict.emplace("file", Config::get_filename());
  }

  return Report_chapter("Configuration", std::move(dict));
}

static std::string human_size(uint64_t bytes) {
  if (bytes >= MiB) {
    return fmt::format("{:.1f} MiB", static_cast<double>(bytes) / MiB);
  }
  if (bytes >= KiB) {
    return fmt::format("{:.1f} KiB", static_cast<double>(bytes) / KiB);
  }
  return fmt::format("{} B", bytes);
}

Report_chapter Host_reporter::produce_chapter() {
  const auto &session = store.get_options().session;

  Chapter_dictionary dict;
  dict["App name"]    = app_name;
  dict["App version"] = fmt::format("{} ({})", session.app_version, session.app_build);
  dict["System"]      = fmt::format("{} {}", Host::os_name(), Host::os_version());
  dict["Locale"]      = Host::locale();
  dict["Timezone"]    = Host::timezone();

  auto space = Host::free_disk_space(store.get_path());
  if (space.ok()) {
    dict["Free disk space"] = human_size(*space);
  } else {
    dict["Free disk space"] = "unknown";
  }

  if (store.is_ready()) {
    auto sz = store.size();
    if (sz.ok()) {
      dict["Log size"] = human_size(*sz);
    }
    dict["Log file"] = store.get_path();
  }

  return Report_chapter("System metadata", std::move(dict));
}

Report_chapter Stats_reporter::produce_chapter() { return Report_chapter("Statistics", Stats::report_all()); }

Redact_filter::Redact_filter(std::vector<std::string> s) : secrets(std::move(s)) {}

Report_chapter Redact_filter::apply(Report_chapter chapter) const {
  std::vector<std::pair<std::string_view, std::string_view>> replacements;
  for (const auto &s : secrets) {
    if (!s.empty()) {
      replacements.emplace_back(s, replacement);
    }
  }
  if (replacements.empty()) {
    return chapter;
  }

  chapter.transform_text([&replacements](const std::string &txt) { return absl::StrReplaceAll(txt, replacements); });

  return chapter;
}
