#include "include/binary_heuristic.hpp"

static constexpr double control_ratio_limit = 0.3;
static constexpr size_t length_limit = 1000;

// Decodes one code point at s[i], advancing i. Invalid bytes decode to
// themselves and advance by one.
static unsigned int next_code_point(std::string_view s, size_t &i) {
  auto c = static_cast<unsigned char>(s[i]);
  size_t len = 1;
  unsigned int cp = c;
  if ((c & 0xE0) == 0xC0) {
    len = 2;
    cp = c & 0x1F;
  } else if ((c & 0xF0) == 0xE0) {
    len = 3;
    cp = c & 0x0F;
  } else if ((c & 0xF8) == 0xF0) {
    len = 4;
    cp = c & 0x07;
  }

  if (len == 1 || i + len > s.size()) {
    ++i;
    return c;
  }
  for (size_t k = 1; k < len; ++k) {
    auto cc = static_cast<unsigned char>(s[i + k]);
    if ((cc & 0xC0) != 0x80) {
      ++i;
      return c;
    }
    cp = (cp << 6) | (cc & 0x3F);
  }
  i += len;
  return cp;
}

size_t utf8_length(std::string_view s) {
  size_t count = 0;
  size_t i = 0;
  while (i < s.size()) {
    next_code_point(s, i);
    ++count;
  }
  return count;
}

bool is_binary_value(std::string_view value) {
  if (value.empty())
    return false;

  size_t total = 0;
  size_t controls = 0;
  size_t i = 0;
  while (i < value.size()) {
    size_t before = i;
    unsigned int cp = next_code_point(value, i);
    // A stray byte in 0x80-0x9F is not a C1 control, only the decoded
    // code point is.
    bool decoded = (i - before) > 1 || cp < 0x80;
    if (cp <= 0x1F || (decoded && cp >= 0x7F && cp <= 0x9F))
      ++controls;
    ++total;
  }

  if (total > length_limit)
    return true;
  return static_cast<double>(controls) / static_cast<double>(total) >
         control_ratio_limit;
}
