#pragma once

#include <cstddef>
#include <string_view>

// Picks the candidate (',', '\t', '|', ';') that splits the first
// sample_lines lines into the most fields with the least variance.
// Falls back to ','.
char detect_delimiter(std::string_view text, size_t sample_lines = 20);
