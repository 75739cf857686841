#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

class MalformedInput : public std::runtime_error {
  size_t offset_;

public:
  MalformedInput(const std::string &what, size_t offset)
      : std::runtime_error(what), offset_(offset) {}

  size_t offset() const { return offset_; }
};

struct RawLine {
  size_t index;
  std::string_view text;
  bool skippable; // blank or '#' comment
};

// Throws MalformedInput at the first byte that is not valid UTF-8.
void validate_utf8(std::string_view content);

bool starts_with_continuation(std::string_view line);

class LineScanner {
private:
  std::string_view content_;
  std::vector<size_t> starts_; // offset of each line, plus a sentinel

public:
  explicit LineScanner(std::string_view content);

  size_t size() const { return starts_.size() - 1; }
  RawLine line(size_t i) const;
};
