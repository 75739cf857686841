#pragma once

#include "csv_reader.hpp"
#include "schema_builder.hpp"
#include "type_inference.hpp"
#include <cstddef>
#include <string>
#include <vector>

struct LdifDocument;

// Produces one Record per entry, row or match of a source format.
class ObservationSource {
public:
  virtual ~ObservationSource() = default;

  virtual InferenceContext context() const = 0;
  virtual size_t record_count() const = 0;
  virtual Record record(size_t i) const = 0;
};

// Attributes of parsed directory entries. objectClass values are not
// fields. The document must outlive the source.
class DirectorySource : public ObservationSource {
private:
  const LdifDocument &doc_;

public:
  explicit DirectorySource(const LdifDocument &doc) : doc_(doc) {}

  InferenceContext context() const override {
    return InferenceContext::Directory;
  }
  size_t record_count() const override;
  Record record(size_t i) const override;
};

struct DelimitedOptions {
  char delimiter = 0; // 0 = detect
  bool has_header = true;
  InferenceContext context = InferenceContext::Delimited;
  size_t max_rows = 0; // 0 = all rows
};

class DelimitedSource : public ObservationSource {
private:
  std::string text_;
  DelimitedOptions options_;
  CsvReader reader_;
  std::vector<std::string> names_;

public:
  DelimitedSource(std::string text, DelimitedOptions options = {});
  DelimitedSource(const DelimitedSource &) = delete;
  DelimitedSource &operator=(const DelimitedSource &) = delete;

  char delimiter() const { return options_.delimiter; }
  const std::vector<std::string> &field_names() const { return names_; }
  size_t total_rows() const;

  InferenceContext context() const override { return options_.context; }
  size_t record_count() const override;
  Record record(size_t i) const override;
};

struct RegexOptions {
  bool ignore_case = false;
  std::vector<std::string> field_names; // group k -> field_names[k - 1]
  InferenceContext context = InferenceContext::Delimited;
};

// One record per line that matches the pattern; fields are the capture
// groups. Throws std::runtime_error on an invalid pattern.
class RegexSource : public ObservationSource {
private:
  std::vector<std::string> names_;
  std::vector<std::vector<std::string>> matches_;
  size_t lines_scanned_ = 0;
  InferenceContext context_;

public:
  RegexSource(const std::string &text, const std::string &pattern,
              RegexOptions options = {});

  const std::vector<std::string> &field_names() const { return names_; }
  size_t lines_scanned() const { return lines_scanned_; }

  InferenceContext context() const override { return context_; }
  size_t record_count() const override { return matches_.size(); }
  Record record(size_t i) const override;
};

// Records from a JSON array of objects, a single object, or JSON Lines.
// Nested objects flatten to dotted paths ("address.city"); array elements
// repeat their field within the record. Throws std::runtime_error when no
// object record is found.
class JsonSource : public ObservationSource {
private:
  std::vector<Record> records_;
  size_t invalid_lines_ = 0;
  InferenceContext context_;

public:
  explicit JsonSource(const std::string &text,
                      InferenceContext context = InferenceContext::Delimited);

  size_t invalid_lines() const { return invalid_lines_; }

  InferenceContext context() const override { return context_; }
  size_t record_count() const override { return records_.size(); }
  Record record(size_t i) const override { return records_[i]; }
};

struct PositionalColumn {
  std::string name;
  size_t start;  // 1-based
  size_t length;
};

struct PositionalOptions {
  std::vector<PositionalColumn> columns;
  bool has_header = false;
  InferenceContext context = InferenceContext::Delimited;
};

// Fixed-width lines cut into the configured columns. Blank lines are
// skipped and cells are trimmed; a line too short for a column leaves it
// null. Throws std::runtime_error on an empty or zero-based column list.
class PositionalSource : public ObservationSource {
private:
  PositionalOptions options_;
  std::vector<std::vector<std::string>> rows_;

public:
  PositionalSource(const std::string &text, PositionalOptions options);

  const std::vector<PositionalColumn> &columns() const {
    return options_.columns;
  }

  InferenceContext context() const override { return options_.context; }
  size_t record_count() const override { return rows_.size(); }
  Record record(size_t i) const override;
};
