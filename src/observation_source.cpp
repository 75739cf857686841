#include "include/observation_source.hpp"
#include "include/delim.hpp"
#include "include/ldif_parser.hpp"
#include "include/line_scanner.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>
#include <regex>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

static std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
    s.remove_prefix(1);
  while (!s.empty() &&
         (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
    s.remove_suffix(1);
  return s;
}

// --- DirectorySource ---

size_t DirectorySource::record_count() const { return doc_.entries.size(); }

Record DirectorySource::record(size_t i) const {
  Record rec;
  for (auto &attr : doc_.entries[i].attributes) {
    for (auto &v : attr.values)
      rec.push_back({attr.name, v, attr.is_binary});
  }
  return rec;
}

// --- DelimitedSource ---

DelimitedSource::DelimitedSource(std::string text, DelimitedOptions options)
    : text_(std::move(text)), options_(options), reader_(text_) {
  if (options_.delimiter == 0)
    options_.delimiter = detect_delimiter(text_);

  // Without a header the reader's header line is the first record
  if (options_.max_rows > 0)
    reader_.parse_head(options_.delimiter,
                       options_.has_header ? options_.max_rows
                                           : options_.max_rows - 1);
  else
    reader_.parse(options_.delimiter);

  auto &headers = reader_.headers();
  names_.reserve(headers.size());
  for (size_t c = 0; c < headers.size(); ++c) {
    std::string name = std::string(trim(unquote(headers[c])));
    if (!options_.has_header || name.empty())
      name = "Column" + std::to_string(c + 1);
    names_.push_back(std::move(name));
  }

  spdlog::debug("delimited: {} columns, {} rows sampled of {}",
                names_.size(), record_count(), total_rows());
}

size_t DelimitedSource::total_rows() const {
  return reader_.total_rows() + (options_.has_header ? 0 : 1);
}

size_t DelimitedSource::record_count() const {
  if (reader_.column_count() == 0)
    return 0;
  return reader_.row_count() + (options_.has_header ? 0 : 1);
}

Record DelimitedSource::record(size_t i) const {
  Record rec;
  rec.reserve(names_.size());

  auto push_cell = [&](size_t c, std::string_view cell) {
    std::string val = std::string(trim(unquote(cell)));
    if (val.empty())
      rec.push_back({names_[c], std::nullopt});
    else
      rec.push_back({names_[c], std::move(val)});
  };

  // Without a header the first line is data.
  if (!options_.has_header) {
    if (i == 0) {
      auto &headers = reader_.headers();
      for (size_t c = 0; c < headers.size(); ++c)
        push_cell(c, headers[c]);
      return rec;
    }
    --i;
  }

  auto row = reader_.row(i);
  for (size_t c = 0; c < row.size(); ++c)
    push_cell(c, row[c]);
  return rec;
}

// --- RegexSource ---

RegexSource::RegexSource(const std::string &text, const std::string &pattern,
                         RegexOptions options)
    : context_(options.context) {
  auto flags = std::regex::ECMAScript;
  if (options.ignore_case)
    flags |= std::regex::icase;

  std::regex re;
  try {
    re.assign(pattern, flags);
  } catch (const std::regex_error &e) {
    throw std::runtime_error("Invalid regex '" + pattern + "': " + e.what());
  }

  size_t groups = re.mark_count();
  if (groups == 0) {
    names_.push_back(options.field_names.empty() ? "match"
                                                 : options.field_names[0]);
  } else {
    for (size_t k = 1; k <= groups; ++k) {
      if (k - 1 < options.field_names.size() &&
          !options.field_names[k - 1].empty())
        names_.push_back(options.field_names[k - 1]);
      else
        names_.push_back("group" + std::to_string(k));
    }
  }

  LineScanner lines(text);
  for (size_t i = 0; i < lines.size(); ++i) {
    RawLine raw = lines.line(i);
    std::string_view view = raw.text;
    if (!view.empty() && view.back() == '\r')
      view.remove_suffix(1);
    if (view.empty())
      continue;
    ++lines_scanned_;

    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_search(view.begin(), view.end(), m, re))
      continue;

    std::vector<std::string> values;
    if (groups == 0) {
      values.push_back(m.str(0));
    } else {
      values.reserve(groups);
      for (size_t k = 1; k <= groups; ++k)
        values.push_back(m[k].matched ? m.str(k) : std::string());
    }
    matches_.push_back(std::move(values));
  }

  spdlog::debug("regex: {} of {} lines matched, {} fields", matches_.size(),
                lines_scanned_, names_.size());
}

Record RegexSource::record(size_t i) const {
  Record rec;
  auto &values = matches_[i];
  rec.reserve(values.size());
  for (size_t k = 0; k < values.size(); ++k) {
    if (values[k].empty())
      rec.push_back({names_[k], std::nullopt});
    else
      rec.push_back({names_[k], values[k]});
  }
  return rec;
}

// --- JsonSource ---

static void flatten_json(const nlohmann::json &node, const std::string &path,
                         Record &rec) {
  switch (node.type()) {
  case nlohmann::json::value_t::object:
    if (node.empty() && !path.empty()) {
      rec.push_back({path, std::nullopt});
      break;
    }
    for (auto it = node.begin(); it != node.end(); ++it)
      flatten_json(it.value(), path.empty() ? it.key() : path + "." + it.key(),
                   rec);
    break;
  case nlohmann::json::value_t::array:
    if (node.empty()) {
      rec.push_back({path, std::nullopt});
      break;
    }
    for (auto &element : node)
      flatten_json(element, path, rec);
    break;
  case nlohmann::json::value_t::null:
  case nlohmann::json::value_t::discarded:
    rec.push_back({path, std::nullopt});
    break;
  case nlohmann::json::value_t::string:
    rec.push_back({path, node.get<std::string>()});
    break;
  case nlohmann::json::value_t::boolean:
    rec.push_back({path, node.get<bool>() ? "true" : "false"});
    break;
  default:
    rec.push_back({path, node.dump()});
    break;
  }
}

JsonSource::JsonSource(const std::string &text, InferenceContext context)
    : context_(context) {
  auto add_object = [&](const nlohmann::json &obj) {
    if (!obj.is_object())
      return;
    Record rec;
    flatten_json(obj, "", rec);
    records_.push_back(std::move(rec));
  };

  try {
    auto doc = nlohmann::json::parse(text);
    if (doc.is_array()) {
      for (auto &element : doc)
        add_object(element);
    } else {
      add_object(doc);
    }
  } catch (const nlohmann::json::parse_error &e) {
    // Not one document, read it as JSON Lines
    spdlog::debug("json: {}, trying JSON Lines", e.what());
    LineScanner lines(text);
    for (size_t i = 0; i < lines.size(); ++i) {
      std::string_view line = trim(lines.line(i).text);
      if (line.empty())
        continue;
      auto doc = nlohmann::json::parse(line, nullptr, false);
      if (doc.is_discarded()) {
        ++invalid_lines_;
        continue;
      }
      add_object(doc);
    }
  }

  if (records_.empty())
    throw std::runtime_error("No valid JSON records found");

  spdlog::debug("json: {} records, {} invalid lines skipped", records_.size(),
                invalid_lines_);
}

// --- PositionalSource ---

PositionalSource::PositionalSource(const std::string &text,
                                   PositionalOptions options)
    : options_(std::move(options)) {
  if (options_.columns.empty())
    throw std::runtime_error("Fixed-width input needs at least one column");
  for (auto &col : options_.columns) {
    if (col.start == 0 || col.length == 0)
      throw std::runtime_error("Column '" + col.name +
                               "' needs a 1-based start and a length");
  }

  LineScanner lines(text);
  bool header_pending = options_.has_header;
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string_view line = lines.line(i).text;
    if (!line.empty() && line.back() == '\r')
      line.remove_suffix(1);
    if (trim(line).empty())
      continue;
    if (header_pending) {
      header_pending = false;
      continue;
    }

    std::vector<std::string> cells;
    cells.reserve(options_.columns.size());
    for (auto &col : options_.columns) {
      size_t begin = col.start - 1;
      if (begin >= line.size()) {
        cells.emplace_back();
        continue;
      }
      size_t len = std::min(col.length, line.size() - begin);
      cells.emplace_back(trim(line.substr(begin, len)));
    }
    rows_.push_back(std::move(cells));
  }

  spdlog::debug("fixed-width: {} rows, {} columns", rows_.size(),
                options_.columns.size());
}

Record PositionalSource::record(size_t i) const {
  Record rec;
  auto &cells = rows_[i];
  rec.reserve(cells.size());
  for (size_t c = 0; c < cells.size(); ++c) {
    if (cells[c].empty())
      rec.push_back({options_.columns[c].name, std::nullopt});
    else
      rec.push_back({options_.columns[c].name, cells[c]});
  }
  return rec;
}
