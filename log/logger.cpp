// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#include "logger.hpp"

#include "absl/time/clock.h"
#include "fmt/format.h"
#include "iassert.hpp"
#include "snippets.hpp"

std::string Logger::format_line(absl::Time when, std::string_view text, const Source_location &loc) {
  auto date = absl::FormatTime("%Y-%m-%d %H:%M:%S", when, absl::UTCTimeZone());

  return fmt::format("{} | {} | {}:{}:L{}\n", date, text, short_file_name(loc.file), loc.function, loc.line);
}

void Logger::write(std::string line) {
  auto st = store.append(std::move(line));
  if (unlikely(!st.ok())) {
    // Logging before Log_store::init is a programming error. The store
    // already counted the dropped line
    I(false);
  }
}

void Logger::message(std::string_view text, const Source_location &loc) { write(format_line(absl::Now(), text, loc)); }

void Logger::error(std::string_view error, std::string_view description, const Source_location &loc) {
  std::string text;
  if (description.empty()) {
    text = fmt::format("ERROR: {}", error);
  } else {
    text = fmt::format("ERROR: {} | {}", error, description);
  }

  write(format_line(absl::Now(), text, loc));
}

void Logger::error(const absl::Status &status, std::string_view description, const Source_location &loc) {
  auto err = fmt::format("{} | {}", absl::StatusCodeToString(status.code()), status.message());

  error(err, description, loc);
}

void Logger::error(const std::exception &e, std::string_view description, const Source_location &loc) {
  error(std::string_view(e.what()), description, loc);
}

void Logger::event(std::string_view name, std::string_view description, const Source_location &loc) {
  std::string text;
  if (description.empty()) {
    text = fmt::format("EVENT: {}", name);
  } else {
    text = fmt::format("EVENT: {} | {}", name, description);
  }

  write(format_line(absl::Now(), text, loc));
}

void Logger::screen(std::string_view name, const Source_location &loc) {
  write(format_line(absl::Now(), fmt::format("SCREEN: {}", name), loc));
}

void Logger::system(std::string_view line) { write(fmt::format("SYSTEM: {}\n", line)); }
