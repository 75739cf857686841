#include "include/ldif_parser.hpp"
#include "include/line_scanner.hpp"
#include "include/log.hpp"
#include "include/mapped_file.hpp"
#include "include/observation_source.hpp"
#include "include/render.hpp"
#include "include/schema_builder.hpp"
#include "include/type_inference.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

static void print_usage() {
  std::cerr
      << "Usage: schemasniff [file | -] [options]\n"
      << "\n"
      << "Options:\n"
      << "  -f, --format <fmt>       Input format: ldif, csv, tsv, json, "
         "fixed, regex\n"
      << "                           (default: by extension, .ldif/.ldf = "
         "ldif,\n"
      << "                           .json/.jsonl/.ndjson = json)\n"
      << "  -d, --delimiter <c>      Field delimiter for csv (default: "
         "detect)\n"
      << "  --no-header              First csv line is data\n"
      << "  --context <ctx>          Thresholds: delimited, spreadsheet, "
         "directory\n"
      << "  -p, --pattern <regex>    Pattern for regex input (capture "
         "groups = fields)\n"
      << "  --field <name>           Name for the next capture group "
         "(repeatable)\n"
      << "  -i, --ignore-case        Case-insensitive regex\n"
      << "  --column <name:start:len> Fixed-width column, 1-based start "
         "(repeatable)\n"
      << "  --skip-header            First fixed-width line is a header\n"
      << "  -n, --samples <N>        Samples kept per field (default: 100)\n"
      << "  --entries                Print parsed ldif entries instead of "
         "the schema\n"
      << "  --json                   JSON output\n"
      << "  --fold-all               Fold continuation lines after any ldif "
         "value\n"
      << "  --no-validate            Skip UTF-8 validation\n"
      << "  -v, --verbose            Debug logging\n"
      << "  -q, --quiet              Errors only\n"
      << "  --log-level <lvl>        debug, info, warn, error, off\n"
      << "  -h, --help               Show this help\n"
      << "\n"
      << "Example: schemasniff people.ldif --json\n"
      << "Stdin:   cat app.log | schemasniff - -f regex -p "
         "'^(\\S+) (\\S+) (.*)$'\n";
}

enum class InputFormat { Ldif, Csv, Json, Fixed, Regex };

static bool ends_with_ci(const std::string &s, const char *suffix) {
  size_t n = std::strlen(suffix);
  if (s.size() < n)
    return false;
  for (size_t i = 0; i < n; ++i) {
    char c = s[s.size() - n + i];
    if (c >= 'A' && c <= 'Z')
      c = static_cast<char>(c + 32);
    if (c != suffix[i])
      return false;
  }
  return true;
}

static char parse_delimiter_arg(const char *arg) {
  if (std::strcmp(arg, "\\t") == 0 || std::strcmp(arg, "tab") == 0)
    return '\t';
  if (std::strlen(arg) != 1)
    return 0;
  return arg[0];
}

// name:start:length, the name may itself contain ':'
static bool parse_column_arg(const char *arg, PositionalColumn &col) {
  std::string s(arg);
  size_t last = s.rfind(':');
  if (last == std::string::npos || last == 0)
    return false;
  size_t mid = s.rfind(':', last - 1);
  if (mid == std::string::npos || mid == 0)
    return false;

  auto to_size = [](const std::string &digits, size_t &out) {
    if (digits.empty() ||
        digits.find_first_not_of("0123456789") != std::string::npos)
      return false;
    out = std::strtoul(digits.c_str(), nullptr, 10);
    return out > 0;
  };
  col.name = s.substr(0, mid);
  return to_size(s.substr(mid + 1, last - mid - 1), col.start) &&
         to_size(s.substr(last + 1), col.length);
}

int main(int argc, char *argv[]) {
  std::string input_path;
  bool format_given = false;
  InputFormat format = InputFormat::Csv;
  DelimitedOptions delimited;
  RegexOptions regex_opts;
  PositionalOptions positional;
  ParseOptions parse_opts;
  std::optional<InferenceContext> context;
  std::string pattern;
  size_t max_samples = 100;
  bool entries_mode = false;
  bool json = false;
  auto level = spdlog::level::info;

  init_logging(level);

  for (int i = 1; i < argc; ++i) {
    if ((std::strcmp(argv[i], "-f") == 0 ||
         std::strcmp(argv[i], "--format") == 0) &&
        i + 1 < argc) {
      ++i;
      format_given = true;
      if (std::strcmp(argv[i], "ldif") == 0)
        format = InputFormat::Ldif;
      else if (std::strcmp(argv[i], "csv") == 0)
        format = InputFormat::Csv;
      else if (std::strcmp(argv[i], "tsv") == 0) {
        format = InputFormat::Csv;
        delimited.delimiter = '\t';
      }
      else if (std::strcmp(argv[i], "json") == 0 ||
               std::strcmp(argv[i], "jsonl") == 0)
        format = InputFormat::Json;
      else if (std::strcmp(argv[i], "fixed") == 0)
        format = InputFormat::Fixed;
      else if (std::strcmp(argv[i], "regex") == 0)
        format = InputFormat::Regex;
      else {
        spdlog::error("Unknown format: {} (use ldif, csv, tsv, json, fixed, "
                      "regex)",
                      argv[i]);
        return 1;
      }
    } else if ((std::strcmp(argv[i], "-d") == 0 ||
                std::strcmp(argv[i], "--delimiter") == 0) &&
               i + 1 < argc) {
      delimited.delimiter = parse_delimiter_arg(argv[++i]);
      if (delimited.delimiter == 0) {
        spdlog::error("Delimiter must be a single character: {}", argv[i]);
        return 1;
      }
    } else if (std::strcmp(argv[i], "--no-header") == 0) {
      delimited.has_header = false;
    } else if (std::strcmp(argv[i], "--context") == 0 && i + 1 < argc) {
      context = parse_context(argv[++i]);
      if (!context) {
        spdlog::error("Unknown context: {} (use delimited, spreadsheet, "
                      "directory)",
                      argv[i]);
        return 1;
      }
    } else if ((std::strcmp(argv[i], "-p") == 0 ||
                std::strcmp(argv[i], "--pattern") == 0) &&
               i + 1 < argc) {
      pattern = argv[++i];
    } else if (std::strcmp(argv[i], "--field") == 0 && i + 1 < argc) {
      regex_opts.field_names.push_back(argv[++i]);
    } else if (std::strcmp(argv[i], "--column") == 0 && i + 1 < argc) {
      PositionalColumn col;
      if (!parse_column_arg(argv[++i], col)) {
        spdlog::error("Column must be name:start:length with start >= 1: {}",
                      argv[i]);
        return 1;
      }
      positional.columns.push_back(std::move(col));
    } else if (std::strcmp(argv[i], "--skip-header") == 0) {
      positional.has_header = true;
    } else if (std::strcmp(argv[i], "-i") == 0 ||
               std::strcmp(argv[i], "--ignore-case") == 0) {
      regex_opts.ignore_case = true;
    } else if ((std::strcmp(argv[i], "-n") == 0 ||
                std::strcmp(argv[i], "--samples") == 0) &&
               i + 1 < argc) {
      int n = std::atoi(argv[++i]);
      if (n <= 0) {
        spdlog::error("--samples must be a positive number: {}", argv[i]);
        return 1;
      }
      max_samples = static_cast<size_t>(n);
    } else if (std::strcmp(argv[i], "--entries") == 0) {
      entries_mode = true;
    } else if (std::strcmp(argv[i], "--json") == 0) {
      json = true;
    } else if (std::strcmp(argv[i], "--fold-all") == 0) {
      parse_opts.fold_non_empty_values = true;
    } else if (std::strcmp(argv[i], "--no-validate") == 0) {
      parse_opts.validate_encoding = false;
    } else if (std::strcmp(argv[i], "-v") == 0 ||
               std::strcmp(argv[i], "--verbose") == 0) {
      level = spdlog::level::debug;
    } else if (std::strcmp(argv[i], "-q") == 0 ||
               std::strcmp(argv[i], "--quiet") == 0) {
      level = spdlog::level::err;
    } else if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
      auto parsed = parse_log_level(argv[++i]);
      if (!parsed) {
        spdlog::error("Unknown log level: {} (use debug, info, warn, error, "
                      "off)",
                      argv[i]);
        return 1;
      }
      level = *parsed;
    } else if (std::strcmp(argv[i], "-h") == 0 ||
               std::strcmp(argv[i], "--help") == 0) {
      print_usage();
      return 0;
    } else if (argv[i][0] != '-' || std::strcmp(argv[i], "-") == 0) {
      input_path = argv[i];
    } else {
      spdlog::error("Unknown option: {}", argv[i]);
      print_usage();
      return 1;
    }
  }

  spdlog::set_level(level);

  // Handle stdin: if no path and stdin is piped, read from stdin
  if (input_path.empty()) {
    if (!isatty(STDIN_FILENO))
      input_path = "-";
    else {
      print_usage();
      return 1;
    }
  }

  if (!format_given) {
    if (ends_with_ci(input_path, ".ldif") || ends_with_ci(input_path, ".ldf"))
      format = InputFormat::Ldif;
    else if (ends_with_ci(input_path, ".json") ||
             ends_with_ci(input_path, ".jsonl") ||
             ends_with_ci(input_path, ".ndjson"))
      format = InputFormat::Json;
    else if (!positional.columns.empty())
      format = InputFormat::Fixed;
    else if (!pattern.empty())
      format = InputFormat::Regex;
  }

  if (format == InputFormat::Regex && pattern.empty()) {
    spdlog::error("--pattern is required for regex input");
    return 1;
  }
  if (format == InputFormat::Fixed && positional.columns.empty()) {
    spdlog::error("--column is required for fixed-width input");
    return 1;
  }
  if (entries_mode && format != InputFormat::Ldif) {
    spdlog::error("--entries is only available for ldif input");
    return 1;
  }

  try {
    MappedFile file(input_path.c_str());

    switch (format) {
    case InputFormat::Ldif: {
      LdifDocument doc = parse_ldif(file.view(), parse_opts);
      DirectorySource source(doc);
      SchemaBuilder builder(context.value_or(InferenceContext::Directory),
                            max_samples);
      for (size_t r = 0; r < source.record_count(); ++r)
        builder.add_record(source.record(r));
      SchemaSummary schema = builder.build();
      assign_attribute_types(doc.entries, schema);

      spdlog::info("{} entries, {} attributes", doc.entries.size(),
                   doc.total_attributes());
      if (doc.entries.empty())
        spdlog::warn("no directory entries found in {}", input_path);

      if (entries_mode && json)
        render_entries_json(doc);
      else if (entries_mode)
        render_entries(doc, 50);
      else if (json)
        render_schema_json(schema, "ldif", doc.base_dn, file.size());
      else
        render_schema_table(schema, "ldif", doc.base_dn, file.size());
      break;
    }
    case InputFormat::Csv: {
      if (context)
        delimited.context = *context;
      DelimitedSource source(std::string(file.view()), delimited);
      if (source.field_names().empty()) {
        spdlog::error("no columns found in {}", input_path);
        return 1;
      }
      SchemaSummary schema = build_schema(source, max_samples);
      spdlog::info("{} rows, {} columns", source.total_rows(),
                   schema.fields.size());

      if (json)
        render_schema_json(schema, "csv", std::nullopt, file.size());
      else
        render_schema_table(schema, "csv", std::nullopt, file.size());
      break;
    }
    case InputFormat::Json: {
      JsonSource source(std::string(file.view()),
                        context.value_or(InferenceContext::Delimited));
      SchemaSummary schema = build_schema(source, max_samples);
      spdlog::info("{} records, {} fields", source.record_count(),
                   schema.fields.size());
      if (source.invalid_lines() > 0)
        spdlog::warn("skipped {} lines that are not valid JSON",
                     source.invalid_lines());

      if (json)
        render_schema_json(schema, "json", std::nullopt, file.size());
      else
        render_schema_table(schema, "json", std::nullopt, file.size());
      break;
    }
    case InputFormat::Fixed: {
      if (context)
        positional.context = *context;
      PositionalSource source(std::string(file.view()), positional);
      SchemaSummary schema = build_schema(source, max_samples);
      spdlog::info("{} rows, {} columns", source.record_count(),
                   schema.fields.size());

      if (json)
        render_schema_json(schema, "fixed", std::nullopt, file.size());
      else
        render_schema_table(schema, "fixed", std::nullopt, file.size());
      break;
    }
    case InputFormat::Regex: {
      if (context)
        regex_opts.context = *context;
      RegexSource source(std::string(file.view()), pattern, regex_opts);
      SchemaSummary schema = build_schema(source, max_samples);
      spdlog::info("{} of {} lines matched", source.record_count(),
                   source.lines_scanned());
      if (source.record_count() == 0)
        spdlog::warn("pattern matched no lines");

      if (json)
        render_schema_json(schema, "regex", std::nullopt, file.size());
      else
        render_schema_table(schema, "regex", std::nullopt, file.size());
      break;
    }
    }
  } catch (const MalformedInput &e) {
    spdlog::error("Malformed input: {}", e.what());
    return 1;
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return 1;
  }

  return 0;
}
