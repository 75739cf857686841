#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

std::string unquote(std::string_view field);

// Splits delimited text into rows of fields. The fields are views into the
// text passed to the constructor, which must outlive the reader.
class CsvReader {
private:
  std::string_view text_;

  std::vector<std::string_view> headers_;
  std::vector<std::string_view> fields_; // flat row-major, stride = ncols_
  size_t ncols_ = 0;
  size_t parsed_rows_ = 0;
  size_t total_rows_ = 0;

  size_t parse_header(char delimiter);
  void append_row_fields(size_t start, size_t end, char delim);
  size_t count_rows_from(size_t offset) const;
  void reset();

public:
  explicit CsvReader(std::string_view text) : text_(text) {}

  void parse(char delimiter);
  void parse_head(char delimiter, size_t max_rows);

  const char *data() const { return text_.data(); }
  size_t size() const { return text_.size(); }
  size_t row_count() const { return parsed_rows_; }
  size_t total_rows() const { return total_rows_; }
  size_t column_count() const { return ncols_; }
  const std::vector<std::string_view> &headers() const { return headers_; }

  std::span<const std::string_view> row(size_t i) const {
    return {fields_.data() + i * ncols_, ncols_};
  }
};
