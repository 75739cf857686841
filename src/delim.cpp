#include "include/delim.hpp"
#include <array>
#include <cmath>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

static size_t count_fields(std::string_view line, char delim) {
  size_t count = 1;
  bool in_quotes = false;
  for (char c : line) {
    if (c == '"')
      in_quotes = !in_quotes;
    else if (!in_quotes && c == delim)
      ++count;
  }
  return count;
}

static std::vector<std::string_view> sample_lines_of(std::string_view text,
                                                     size_t limit) {
  std::vector<std::string_view> lines;
  lines.reserve(limit);
  size_t pos = 0;
  while (pos < text.size() && lines.size() < limit) {
    size_t start = pos;
    bool in_quotes = false;
    while (pos < text.size()) {
      if (text[pos] == '"')
        in_quotes = !in_quotes;
      else if (!in_quotes && text[pos] == '\n')
        break;
      ++pos;
    }
    size_t end = pos;
    if (end > start && text[end - 1] == '\r')
      --end;
    if (end > start)
      lines.push_back(text.substr(start, end - start));
    if (pos < text.size())
      ++pos; // skip \n
  }
  return lines;
}

char detect_delimiter(std::string_view text, size_t sample_lines) {
  constexpr std::array<char, 4> candidates = {',', '\t', '|', ';'};

  auto lines = sample_lines_of(text, sample_lines);
  if (lines.empty())
    return ',';

  char best = ',';
  double best_score = -1.0;
  for (char c : candidates) {
    double sum = 0;
    std::vector<double> counts;
    counts.reserve(lines.size());
    for (auto line : lines) {
      counts.push_back(static_cast<double>(count_fields(line, c)));
      sum += counts.back();
    }

    // Need at least 2 fields to be a valid delimiter
    double mean = sum / static_cast<double>(counts.size());
    if (mean < 2.0)
      continue;

    double var = 0;
    for (double v : counts)
      var += (v - mean) * (v - mean);
    double stddev = std::sqrt(var / static_cast<double>(counts.size()));

    double score = mean / (1.0 + stddev);
    if (score > best_score) {
      best_score = score;
      best = c;
    }
  }

  std::string shown = best == '\t' ? std::string("\\t") : std::string(1, best);
  spdlog::debug("detected delimiter '{}'", shown);
  return best;
}
