#pragma once

#include "type_inference.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct Attribute {
  std::string name;
  std::vector<std::string> values;
  bool is_multi_valued = false;
  bool is_binary = false;
  std::optional<SemanticType> inferred_type; // filled by the schema builder
};

struct DirectoryEntry {
  std::string dn;
  std::vector<std::string> object_classes;
  std::vector<Attribute> attributes;
  size_t entry_index = 0;
};

struct LdifDocument {
  std::vector<DirectoryEntry> entries;
  std::optional<std::string> base_dn;

  size_t total_attributes() const;
};

struct ParseOptions {
  bool validate_encoding = true;
  // Drop one trailing '\r' from every line before it is interpreted.
  bool strip_carriage_returns = true;
  // By default only an empty "name:" value is followed by continuation
  // lines. Set to fold every value.
  bool fold_non_empty_values = false;
};

// Throws MalformedInput when validate_encoding is set and the content is
// not UTF-8. Structurally malformed lines are skipped, never reported.
LdifDocument parse_ldif(std::string_view content,
                        const ParseOptions &options = {});

// Last two comma-separated components of dn, or dn itself.
std::string extract_base_dn(std::string_view dn);
