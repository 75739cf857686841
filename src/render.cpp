#include "include/render.hpp"
#include "include/binary_heuristic.hpp"
#include "include/ldif_parser.hpp"
#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <sys/ioctl.h>
#include <unistd.h>
#include <vector>

std::pair<size_t, size_t> get_terminal_size() {
  struct winsize w;
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
    return {w.ws_row, w.ws_col};
  return {24, 80};
}

static std::string format_size(size_t bytes) {
  const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  double val = static_cast<double>(bytes);
  int idx = 0;
  while (val >= 1024.0 && idx < 4) {
    val /= 1024.0;
    ++idx;
  }
  std::ostringstream oss;
  if (idx == 0)
    oss << bytes << " B";
  else
    oss << std::fixed << std::setprecision(1) << val << " " << units[idx];
  return oss.str();
}

// Cuts at max_w code points so multi-byte characters are never split.
static std::string truncate(std::string_view s, size_t max_w) {
  if (utf8_length(s) <= max_w)
    return std::string(s);
  if (max_w <= 3)
    return std::string(max_w, '.');
  size_t keep = max_w - 3;
  size_t i = 0;
  size_t cps = 0;
  while (i < s.size() && cps < keep) {
    ++i;
    while (i < s.size() && (static_cast<unsigned char>(s[i]) & 0xC0) == 0x80)
      ++i;
    ++cps;
  }
  return std::string(s.substr(0, i)) + "...";
}

static std::string join_samples(const std::vector<std::string> &samples) {
  std::string out;
  for (size_t i = 0; i < samples.size(); ++i) {
    if (i > 0)
      out += ", ";
    out += samples[i];
  }
  return out;
}

// --- Schema table ---

void render_schema_table(const SchemaSummary &schema, std::string_view format,
                         const std::optional<std::string> &base_dn,
                         size_t file_size) {
  size_t term_w = get_terminal_size().second;

  const std::vector<std::string> headers = {"field",  "type",   "null",
                                            "multi",  "length", "samples"};
  std::vector<std::vector<std::string>> rows;
  rows.reserve(schema.fields.size());
  for (auto &f : schema.fields) {
    rows.push_back({f.name, std::string(type_name(f.type)),
                    f.nullable ? "yes" : "no", f.multi_valued ? "yes" : "no",
                    f.recommended_length
                        ? std::to_string(*f.recommended_length)
                        : "-",
                    join_samples(f.sample_values)});
  }

  size_t ncols = headers.size();
  std::vector<size_t> col_widths(ncols, 0);
  for (size_t c = 0; c < ncols; ++c)
    col_widths[c] = headers[c].size();
  for (auto &row : rows) {
    for (size_t c = 0; c < ncols; ++c)
      col_widths[c] = std::max(col_widths[c], utf8_length(row[c]));
  }

  // The samples column absorbs whatever the terminal cannot fit
  size_t fixed = ncols * 3 + 1;
  for (size_t c = 0; c + 1 < ncols; ++c)
    fixed += col_widths[c];
  if (fixed < term_w)
    col_widths.back() =
        std::max(static_cast<size_t>(10),
                 std::min(col_widths.back(), term_w - fixed));

  auto hline = [&](const char *left, const char *mid, const char *right) {
    std::cout << left;
    for (size_t c = 0; c < ncols; ++c) {
      for (size_t i = 0; i < col_widths[c] + 2; ++i)
        std::cout << "\u2500";
      if (c + 1 < ncols)
        std::cout << mid;
    }
    std::cout << right << "\n";
  };

  auto print_row = [&](const std::vector<std::string> &cells) {
    std::cout << "\u2502";
    for (size_t c = 0; c < ncols; ++c) {
      std::string display = truncate(cells[c], col_widths[c]);
      size_t pad = col_widths[c] - utf8_length(display);
      std::cout << " " << display << std::string(pad, ' ') << " \u2502";
    }
    std::cout << "\n";
  };

  hline("\u250C", "\u252C", "\u2510");
  print_row(headers);
  hline("\u251C", "\u253C", "\u2524");
  for (auto &row : rows)
    print_row(row);
  hline("\u2514", "\u2534", "\u2518");

  std::cout << format << " | " << schema.total_records << " records | "
            << schema.fields.size() << " fields | " << schema.total_values
            << " values | " << format_size(file_size);
  if (base_dn)
    std::cout << " | base " << *base_dn;
  std::cout << "\n";
}

// --- JSON output ---

std::string json_escape(std::string_view val) {
  std::string result;
  result.reserve(val.size());
  for (char c : val) {
    switch (c) {
    case '"':
      result += "\\\"";
      break;
    case '\\':
      result += "\\\\";
      break;
    case '\n':
      result += "\\n";
      break;
    case '\r':
      result += "\\r";
      break;
    case '\t':
      result += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buf[8];
        snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
        result += buf;
      } else {
        result += c;
      }
    }
  }
  return result;
}

void render_schema_json(const SchemaSummary &schema, std::string_view format,
                        const std::optional<std::string> &base_dn,
                        size_t file_size) {
  std::cout << "{\n";
  std::cout << "  \"format\": \"" << json_escape(format) << "\",\n";
  std::cout << "  \"file_size\": " << file_size << ",\n";
  std::cout << "  \"total_records\": " << schema.total_records << ",\n";
  std::cout << "  \"total_values\": " << schema.total_values << ",\n";
  if (base_dn)
    std::cout << "  \"base_dn\": \"" << json_escape(*base_dn) << "\",\n";
  std::cout << "  \"fields\": [\n";
  for (size_t i = 0; i < schema.fields.size(); ++i) {
    auto &f = schema.fields[i];
    std::cout << "    {\"name\": \"" << json_escape(f.name)
              << "\", \"type\": \"" << type_name(f.type)
              << "\", \"nullable\": " << (f.nullable ? "true" : "false")
              << ", \"multi_valued\": " << (f.multi_valued ? "true" : "false")
              << ", \"length\": ";
    if (f.recommended_length)
      std::cout << *f.recommended_length;
    else
      std::cout << "null";
    std::cout << ", \"samples\": [";
    for (size_t s = 0; s < f.sample_values.size(); ++s) {
      if (s > 0)
        std::cout << ", ";
      std::cout << "\"" << json_escape(f.sample_values[s]) << "\"";
    }
    std::cout << "]}";
    if (i + 1 < schema.fields.size())
      std::cout << ",";
    std::cout << "\n";
  }
  std::cout << "  ]\n";
  std::cout << "}\n";
}

// --- Entries ---

void render_entries(const LdifDocument &doc, size_t max_entries) {
  size_t n = std::min(doc.entries.size(), max_entries);
  for (size_t i = 0; i < n; ++i) {
    auto &e = doc.entries[i];
    std::cout << "[" << e.entry_index << "] " << e.dn << "\n";
    if (!e.object_classes.empty()) {
      std::cout << "    objectClass: " << join_samples(e.object_classes)
                << "\n";
    }
    for (auto &a : e.attributes) {
      std::cout << "    " << a.name;
      if (a.inferred_type)
        std::cout << " (" << type_name(*a.inferred_type) << ")";
      std::cout << ": ";
      if (a.is_binary)
        std::cout << "<binary, " << a.values.size() << " value(s)>";
      else
        std::cout << truncate(join_samples(a.values), 60);
      std::cout << "\n";
    }
  }
  if (n < doc.entries.size())
    std::cout << "... and " << (doc.entries.size() - n) << " more entries\n";
  std::cout << doc.entries.size() << " entries | " << doc.total_attributes()
            << " attributes";
  if (doc.base_dn)
    std::cout << " | base " << *doc.base_dn;
  std::cout << "\n";
}

void render_entries_json(const LdifDocument &doc) {
  std::cout << "{\n";
  if (doc.base_dn)
    std::cout << "  \"base_dn\": \"" << json_escape(*doc.base_dn) << "\",\n";
  else
    std::cout << "  \"base_dn\": null,\n";
  std::cout << "  \"total_entries\": " << doc.entries.size() << ",\n";
  std::cout << "  \"total_attributes\": " << doc.total_attributes() << ",\n";
  std::cout << "  \"entries\": [\n";
  for (size_t i = 0; i < doc.entries.size(); ++i) {
    auto &e = doc.entries[i];
    std::cout << "    {\"index\": " << e.entry_index << ", \"dn\": \""
              << json_escape(e.dn) << "\", \"object_classes\": [";
    for (size_t k = 0; k < e.object_classes.size(); ++k) {
      if (k > 0)
        std::cout << ", ";
      std::cout << "\"" << json_escape(e.object_classes[k]) << "\"";
    }
    std::cout << "], \"attributes\": [";
    for (size_t k = 0; k < e.attributes.size(); ++k) {
      auto &a = e.attributes[k];
      if (k > 0)
        std::cout << ", ";
      std::cout << "{\"name\": \"" << json_escape(a.name) << "\", \"type\": ";
      if (a.inferred_type)
        std::cout << "\"" << type_name(*a.inferred_type) << "\"";
      else
        std::cout << "null";
      std::cout << ", \"multi_valued\": "
                << (a.is_multi_valued ? "true" : "false")
                << ", \"binary\": " << (a.is_binary ? "true" : "false")
                << ", \"values\": [";
      for (size_t v = 0; v < a.values.size(); ++v) {
        if (v > 0)
          std::cout << ", ";
        std::cout << "\"" << json_escape(a.values[v]) << "\"";
      }
      std::cout << "]}";
    }
    std::cout << "]}";
    if (i + 1 < doc.entries.size())
      std::cout << ",";
    std::cout << "\n";
  }
  std::cout << "  ]\n";
  std::cout << "}\n";
}
