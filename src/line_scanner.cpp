#include "include/line_scanner.hpp"
#include <cstring>
#include <string>

void validate_utf8(std::string_view content) {
  const auto *s = reinterpret_cast<const unsigned char *>(content.data());
  size_t n = content.size();
  size_t i = 0;

  while (i < n) {
    unsigned char c = s[i];
    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t len;
    unsigned int cp;
    if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
    } else {
      throw MalformedInput("Invalid UTF-8 lead byte at offset " +
                               std::to_string(i),
                           i);
    }

    if (i + len > n)
      throw MalformedInput("Truncated UTF-8 sequence at offset " +
                               std::to_string(i),
                           i);

    for (size_t k = 1; k < len; ++k) {
      if ((s[i + k] & 0xC0) != 0x80)
        throw MalformedInput("Invalid UTF-8 continuation byte at offset " +
                                 std::to_string(i + k),
                             i + k);
      cp = (cp << 6) | (s[i + k] & 0x3F);
    }

    // Overlong forms, surrogates and out-of-range code points
    static constexpr unsigned int min_cp[] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < min_cp[len] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
      throw MalformedInput("Invalid UTF-8 code point at offset " +
                               std::to_string(i),
                           i);

    i += len;
  }
}

bool starts_with_continuation(std::string_view line) {
  return !line.empty() && line.front() == ' ';
}

// --- LineScanner ---

LineScanner::LineScanner(std::string_view content) : content_(content) {
  starts_.push_back(0);
  size_t pos = 0;
  while (pos < content_.size()) {
    const void *nl =
        memchr(content_.data() + pos, '\n', content_.size() - pos);
    if (!nl)
      break;
    pos = static_cast<size_t>(static_cast<const char *>(nl) -
                              content_.data()) +
          1;
    starts_.push_back(pos);
  }
  // Sentinel one past the last line, so line i spans
  // [starts_[i], starts_[i + 1] - 1).
  starts_.push_back(content_.size() + 1);
}

RawLine LineScanner::line(size_t i) const {
  size_t start = starts_[i];
  size_t end = starts_[i + 1] - 1;
  std::string_view text = content_.substr(start, end - start);
  bool skippable =
      text.find_first_not_of(" \t\r") == std::string_view::npos ||
      text.front() == '#';
  return {i, text, skippable};
}
