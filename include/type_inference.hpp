#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class SemanticType {
  String,
  Integer,
  Decimal,
  Date,
  Boolean,
  Email,
  DistinguishedName,
  Telephone,
  Password,
  ObjectClass,
  Timestamp,
  BinaryHash,
  Binary
};

// Selects the threshold and length profile. Delimited is the lenient one,
// Spreadsheet and Directory the strict ones.
enum class InferenceContext { Delimited, Spreadsheet, Directory };

struct Thresholds {
  double date;
  double numeric;
  double integer; // share of numeric samples that must be whole
  double boolean;
  size_t integer_length;
  size_t decimal_length;
};

std::string_view type_name(SemanticType t);
std::string_view context_name(InferenceContext c);
std::optional<InferenceContext> parse_context(std::string_view s);
const Thresholds &thresholds_for(InferenceContext c);

bool is_date_like(std::string_view s);
bool is_numeric_like(std::string_view s, double *out = nullptr);
bool is_boolean_like(std::string_view s);
bool is_email_like(std::string_view s);
bool is_dn_like(std::string_view s);
bool is_generalized_time(std::string_view s);
bool is_hex_hash(std::string_view s);

// Samples must already exclude empty and null values.
SemanticType classify_samples(const std::vector<std::string> &samples,
                              InferenceContext ctx);

// classify_samples plus the attribute-name and value rules used for
// directory attributes (Directory context only).
SemanticType classify_field(std::string_view name,
                            const std::vector<std::string> &samples,
                            InferenceContext ctx, bool binary_hint = false);

std::optional<size_t>
recommended_length(SemanticType t, const std::vector<std::string> &samples,
                   InferenceContext ctx);
