#include "include/csv_reader.hpp"
#include <cstring>
#include <limits>
#include <string>

// --- Utility ---

std::string unquote(std::string_view field) {
  if (field.size() >= 2 && field.front() == '"' && field.back() == '"') {
    field.remove_prefix(1);
    field.remove_suffix(1);
    std::string result;
    result.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i) {
      if (field[i] == '"' && i + 1 < field.size() && field[i + 1] == '"') {
        result += '"';
        ++i;
      } else {
        result += field[i];
      }
    }
    return result;
  }
  return std::string(field);
}

// --- Line-end finder (memchr fast-path, quote-aware fallback) ---

static size_t find_line_end(const char *base, size_t total, size_t start) {
  const void *nl = memchr(base + start, '\n', total - start);
  size_t nl_pos =
      nl ? static_cast<size_t>(static_cast<const char *>(nl) - base) : total;

  const void *q = memchr(base + start, '"', nl_pos - start);
  if (!q)
    return nl_pos; // No quotes → newline is a row boundary

  bool in_quotes = false;
  for (size_t i = start; i < total; ++i) {
    if (base[i] == '"')
      in_quotes = !in_quotes;
    else if (!in_quotes && base[i] == '\n')
      return i;
  }
  return total;
}

// Calls emit(start, len) for each field of base[start, end), at most
// max_fields times. Returns the number of fields emitted.
template <typename Emit>
static size_t split_fields(const char *base, size_t start, size_t end,
                           char delim, size_t max_fields, Emit emit) {
  size_t emitted = 0;
  size_t i = start;
  while (i < end && emitted < max_fields) {
    if (base[i] == '"') {
      size_t fs = i++;
      while (i < end) {
        if (base[i] == '"') {
          if (i + 1 < end && base[i + 1] == '"')
            i += 2;
          else
            break;
        } else
          ++i;
      }
      if (i < end)
        ++i; // closing quote
      emit(fs, i - fs);
      ++emitted;
      if (i < end && base[i] == delim)
        ++i;
    } else {
      size_t fs = i;
      while (i < end && base[i] != delim)
        ++i;
      emit(fs, i - fs);
      ++emitted;
      if (i < end)
        ++i;
    }
  }
  // Trailing delimiter → one more empty field
  if (emitted < max_fields && end > start && base[end - 1] == delim) {
    emit(end, 0);
    ++emitted;
  }
  return emitted;
}

// --- CsvReader implementation ---

void CsvReader::reset() {
  headers_.clear();
  fields_.clear();
  parsed_rows_ = 0;
  total_rows_ = 0;
  ncols_ = 0;
}

size_t CsvReader::parse_header(char delimiter) {
  if (text_.empty())
    return 0;

  const char *base = data();
  size_t total = size();
  size_t line_end = find_line_end(base, total, 0);
  size_t actual_end = line_end;
  if (actual_end > 0 && base[actual_end - 1] == '\r')
    --actual_end;

  split_fields(base, 0, actual_end, delimiter,
               std::numeric_limits<size_t>::max(),
               [&](size_t fs, size_t len) {
                 headers_.emplace_back(base + fs, len);
               });
  ncols_ = headers_.size();

  return (line_end < total) ? line_end + 1 : total;
}

void CsvReader::append_row_fields(size_t start, size_t end, char delim) {
  const char *base = data();
  size_t added = split_fields(base, start, end, delim, ncols_,
                              [&](size_t fs, size_t len) {
                                fields_.emplace_back(base + fs, len);
                              });

  // Pad ragged rows
  for (; added < ncols_; ++added)
    fields_.emplace_back();
}

size_t CsvReader::count_rows_from(size_t offset) const {
  if (offset >= size())
    return 0;

  const char *d = data() + offset;
  size_t len = size() - offset;
  size_t count = 0;
  bool in_quotes = false;
  bool line_has_content = false;
  for (size_t i = 0; i < len; ++i) {
    if (d[i] == '"') {
      in_quotes = !in_quotes;
      line_has_content = true;
    } else if (!in_quotes && d[i] == '\n') {
      if (line_has_content)
        ++count;
      line_has_content = false;
    } else if (d[i] != '\r') {
      line_has_content = true;
    }
  }
  if (line_has_content)
    ++count;
  return count;
}

void CsvReader::parse(char delimiter) {
  parse_head(delimiter, std::numeric_limits<size_t>::max());
}

void CsvReader::parse_head(char delimiter, size_t max_rows) {
  reset();

  size_t pos = parse_header(delimiter);
  if (ncols_ == 0)
    return;

  const char *base = data();
  size_t total = size();

  while (pos < total && parsed_rows_ < max_rows) {
    size_t line_end = find_line_end(base, total, pos);
    size_t actual_end = line_end;
    if (actual_end > pos && base[actual_end - 1] == '\r')
      --actual_end;

    if (actual_end == pos) {
      pos = (line_end < total) ? line_end + 1 : total;
      continue;
    }

    append_row_fields(pos, actual_end, delimiter);
    ++parsed_rows_;
    pos = (line_end < total) ? line_end + 1 : total;
  }

  // Count remaining rows without parsing them
  total_rows_ = parsed_rows_ + count_rows_from(pos);
}
