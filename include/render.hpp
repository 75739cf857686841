#pragma once

#include "schema_builder.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

struct LdifDocument;

std::pair<size_t, size_t> get_terminal_size();

std::string json_escape(std::string_view val);

void render_schema_table(const SchemaSummary &schema, std::string_view format,
                         const std::optional<std::string> &base_dn,
                         size_t file_size);

void render_schema_json(const SchemaSummary &schema, std::string_view format,
                        const std::optional<std::string> &base_dn,
                        size_t file_size);

void render_entries(const LdifDocument &doc, size_t max_entries);

void render_entries_json(const LdifDocument &doc);
