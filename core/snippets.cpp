// This file is distributed under the BSD 3-Clause License. See LICENSE for details.

#include "snippets.hpp"

std::string_view short_file_name(std::string_view path) {
  auto pos = path.rfind('/');
  if (pos == std::string_view::npos) {
    return path;
  }

  return path.substr(pos + 1);
}

bool is_valid_utf8(std::string_view buf, bool allow_truncated_tail) {
  const auto *s = reinterpret_cast<const unsigned char *>(buf.data());
  size_t      n = buf.size();
  size_t      i = 0;

  while (i < n) {
    unsigned char c = s[i];
    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t   len;
    uint32_t cp;
    if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp  = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp  = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp  = c & 0x07;
    } else {
      return false;
    }

    if (i + len > n) {
      // Only continuation bytes may follow before the end
      for (size_t j = i + 1; j < n; ++j) {
        if ((s[j] & 0xC0) != 0x80) {
          return false;
        }
      }
      return allow_truncated_tail;
    }

    for (size_t j = 1; j < len; ++j) {
      if ((s[i + j] & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (s[i + j] & 0x3F);
    }

    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
      return false;  // overlong
    }
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }

    i += len;
  }

  return true;
}
