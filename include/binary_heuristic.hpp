#pragma once

#include <cstddef>
#include <string_view>

// Code points, not bytes. A byte that does not start a valid UTF-8
// sequence counts as one code point.
size_t utf8_length(std::string_view s);

// True when more than 30% of the code points are C0/C1 controls or the
// value is longer than 1000 code points.
bool is_binary_value(std::string_view value);
