// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#pragma once

#include <cstdint>
#include <string_view>

constexpr uint64_t KiB = 1024;
constexpr uint64_t MiB = 1024 * KiB;

#define likely(x)   __builtin_expect(!!(x), 1)
#define unlikely(x) __builtin_expect(!!(x), 0)

// "/a/b/c.cpp" -> "c.cpp"
std::string_view short_file_name(std::string_view path);

// true if the buffer is well formed UTF-8 (no overlong forms or surrogates).
// A sequence truncated at the end of the buffer is accepted when
// allow_truncated_tail is set
bool is_valid_utf8(std::string_view buf, bool allow_truncated_tail = false);
