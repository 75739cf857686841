#include "include/schema_builder.hpp"
#include "include/ldif_parser.hpp"
#include "include/observation_source.hpp"
#include <spdlog/spdlog.h>

SchemaBuilder::SchemaBuilder(InferenceContext context, size_t max_samples)
    : context_(context), max_samples_(max_samples) {}

void SchemaBuilder::add_record(const Record &record) {
  ++record_count_;

  // Non-null values contributed by this record, per field
  std::unordered_map<size_t, size_t> seen;

  for (auto &fv : record) {
    auto it = index_.find(fv.name);
    size_t idx;
    if (it == index_.end()) {
      idx = observations_.size();
      index_.emplace(fv.name, idx);
      observations_.emplace_back();
      observations_.back().field_name = fv.name;
    } else {
      idx = it->second;
    }

    FieldObservation &obs = observations_[idx];
    bool is_null = !fv.value || fv.value->empty();
    if (fv.binary)
      obs.binary_hint = true;

    // Nulls are counted, never sampled
    if (is_null) {
      obs.declared_nullable_hint = true;
      ++obs.null_count;
      continue;
    }

    ++value_count_;
    size_t &count = seen[idx];
    if (++count == 1)
      ++obs.records_with_value;
    else
      obs.multi_valued = true;

    if (obs.samples.size() < max_samples_)
      obs.samples.emplace_back(*fv.value);
  }
}

SchemaField build_field(const FieldObservation &obs, size_t total_records,
                        InferenceContext ctx) {
  const std::vector<std::string> &values = obs.samples;

  SchemaField field;
  field.name = obs.field_name;
  field.type = classify_field(obs.field_name, values, ctx, obs.binary_hint);
  field.nullable =
      obs.declared_nullable_hint || obs.records_with_value < total_records;
  field.multi_valued = obs.multi_valued;
  field.recommended_length = recommended_length(field.type, values, ctx);
  for (size_t i = 0; i < values.size() && i < SchemaBuilder::preview_size; ++i)
    field.sample_values.push_back(values[i]);
  return field;
}

SchemaSummary SchemaBuilder::build() const {
  SchemaSummary summary;
  summary.total_records = record_count_;
  summary.total_values = value_count_;
  summary.fields.reserve(observations_.size());
  for (auto &obs : observations_)
    summary.fields.push_back(build_field(obs, record_count_, context_));

  spdlog::debug("schema: {} fields from {} records ({} context)",
                summary.fields.size(), record_count_, context_name(context_));
  return summary;
}

SchemaSummary build_schema(const ObservationSource &source,
                           size_t max_samples) {
  SchemaBuilder builder(source.context(), max_samples);
  size_t n = source.record_count();
  for (size_t i = 0; i < n; ++i)
    builder.add_record(source.record(i));
  return builder.build();
}

void assign_attribute_types(std::vector<DirectoryEntry> &entries,
                            const SchemaSummary &schema) {
  std::unordered_map<std::string, SemanticType> types;
  for (auto &f : schema.fields)
    types.emplace(f.name, f.type);

  for (auto &entry : entries) {
    for (auto &attr : entry.attributes) {
      auto it = types.find(attr.name);
      attr.inferred_type =
          it != types.end()
              ? it->second
              : classify_field(attr.name, attr.values,
                               InferenceContext::Directory, attr.is_binary);
    }
  }
}
