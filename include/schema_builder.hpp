#pragma once

#include "type_inference.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

class ObservationSource;
struct DirectoryEntry;

struct FieldValue {
  std::string name;
  std::optional<std::string> value; // nullopt or "" = null
  bool binary = false;
};

// One entry, row or match, fields in source order.
using Record = std::vector<FieldValue>;

struct FieldObservation {
  std::string field_name;
  std::vector<std::string> samples; // first max_samples non-null values
  size_t null_count = 0;
  bool declared_nullable_hint = false;
  size_t records_with_value = 0;
  bool multi_valued = false;
  bool binary_hint = false;
};

struct SchemaField {
  std::string name;
  SemanticType type = SemanticType::String;
  bool nullable = false;
  bool multi_valued = false;
  std::optional<size_t> recommended_length;
  std::vector<std::string> sample_values;
};

struct SchemaSummary {
  std::vector<SchemaField> fields;
  size_t total_records = 0;
  size_t total_values = 0;
};

class SchemaBuilder {
private:
  InferenceContext context_;
  size_t max_samples_;
  size_t record_count_ = 0;
  size_t value_count_ = 0;
  std::vector<FieldObservation> observations_; // first-seen order
  std::unordered_map<std::string, size_t> index_;

public:
  static constexpr size_t preview_size = 5;

  explicit SchemaBuilder(InferenceContext context, size_t max_samples = 100);

  void add_record(const Record &record);

  size_t record_count() const { return record_count_; }
  const std::vector<FieldObservation> &observations() const {
    return observations_;
  }

  SchemaSummary build() const;
};

SchemaField build_field(const FieldObservation &obs, size_t total_records,
                        InferenceContext ctx);

SchemaSummary build_schema(const ObservationSource &source,
                           size_t max_samples = 100);

// Sets each attribute's inferred_type from the schema field of its name.
void assign_attribute_types(std::vector<DirectoryEntry> &entries,
                            const SchemaSummary &schema);
