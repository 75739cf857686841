#include "include/ldif_parser.hpp"
#include "include/binary_heuristic.hpp"
#include "include/line_scanner.hpp"
#include <spdlog/spdlog.h>
#include <utility>

static std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
    s.remove_prefix(1);
  while (!s.empty() &&
         (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
    s.remove_suffix(1);
  return s;
}

static bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size())
    return false;
  for (size_t i = 0; i < a.size(); ++i) {
    char x = a[i] >= 'A' && a[i] <= 'Z' ? static_cast<char>(a[i] + 32) : a[i];
    char y = b[i] >= 'A' && b[i] <= 'Z' ? static_cast<char>(b[i] + 32) : b[i];
    if (x != y)
      return false;
  }
  return true;
}

size_t LdifDocument::total_attributes() const {
  size_t n = 0;
  for (auto &e : entries)
    n += e.attributes.size();
  return n;
}

std::string extract_base_dn(std::string_view dn) {
  auto last = dn.rfind(',');
  if (last == std::string_view::npos || last == 0)
    return std::string(trim(dn));
  auto prev = dn.rfind(',', last - 1);
  if (prev == std::string_view::npos)
    return std::string(trim(dn));
  return std::string(trim(dn.substr(prev + 1)));
}

namespace {

enum class ParserState { OutsideEntry, InEntry, InAttribute };

class EntryParser {
private:
  const LineScanner &lines_;
  const ParseOptions &options_;
  ParserState state_ = ParserState::OutsideEntry;
  std::optional<DirectoryEntry> entry_;
  std::optional<Attribute> open_attr_;
  std::vector<DirectoryEntry> entries_;
  size_t skipped_ = 0;

  std::string_view text_at(size_t i) const {
    std::string_view text = lines_.line(i).text;
    if (options_.strip_carriage_returns && !text.empty() &&
        text.back() == '\r')
      text.remove_suffix(1);
    return text;
  }

  void skip(size_t i, const char *reason) {
    ++skipped_;
    spdlog::debug("ldif line {}: skipped ({})", i + 1, reason);
  }

  void flush_attribute();
  void flush_entry();
  void begin_entry(std::string_view dn);
  void add_attribute_value(std::string_view name, std::string value);
  size_t read_continuations(size_t i, std::string &value) const;

public:
  EntryParser(const LineScanner &lines, const ParseOptions &options)
      : lines_(lines), options_(options) {}

  std::vector<DirectoryEntry> run();
};

void EntryParser::flush_attribute() {
  if (open_attr_ && entry_ && !open_attr_->values.empty())
    entry_->attributes.push_back(std::move(*open_attr_));
  open_attr_.reset();
  if (state_ == ParserState::InAttribute)
    state_ = ParserState::InEntry;
}

void EntryParser::flush_entry() {
  if (entry_) {
    if (!entry_->dn.empty()) {
      entry_->entry_index = entries_.size();
      entries_.push_back(std::move(*entry_));
    } else {
      spdlog::debug("ldif: dropping entry with empty dn");
    }
  }
  entry_.reset();
  state_ = ParserState::OutsideEntry;
}

void EntryParser::begin_entry(std::string_view dn) {
  if (state_ != ParserState::OutsideEntry) {
    flush_attribute();
    flush_entry();
  }
  entry_.emplace();
  entry_->dn = std::string(dn);
  state_ = ParserState::InEntry;
}

void EntryParser::add_attribute_value(std::string_view name,
                                      std::string value) {
  if (iequals(name, "objectClass")) {
    entry_->object_classes.push_back(std::move(value));
    return;
  }

  // Case-sensitive on purpose: "mail" followed by "Mail" opens a new
  // attribute, unlike the objectClass and dn: checks.
  if (open_attr_ && open_attr_->name == name) {
    open_attr_->values.push_back(std::move(value));
    open_attr_->is_multi_valued = true;
    return;
  }

  flush_attribute();
  open_attr_.emplace();
  open_attr_->name = std::string(name);
  open_attr_->is_binary = is_binary_value(value);
  open_attr_->values.push_back(std::move(value));
  state_ = ParserState::InAttribute;
}

size_t EntryParser::read_continuations(size_t i, std::string &value) const {
  while (i + 1 < lines_.size()) {
    std::string_view next = text_at(i + 1);
    if (!starts_with_continuation(next))
      break;
    next.remove_prefix(1);
    value.append(next.data(), next.size());
    ++i;
  }
  // Same trailing trim as an inline value
  while (!value.empty() &&
         (value.back() == ' ' || value.back() == '\t' || value.back() == '\r'))
    value.pop_back();
  return i;
}

std::vector<DirectoryEntry> EntryParser::run() {
  for (size_t i = 0; i < lines_.size(); ++i) {
    RawLine raw = lines_.line(i);
    if (raw.skippable)
      continue;

    std::string_view text = text_at(i);
    if (starts_with_continuation(text)) {
      skip(i, "continuation without an open value");
      continue;
    }

    std::string_view line = trim(text);
    if (line.size() >= 3 && iequals(line.substr(0, 3), "dn:")) {
      begin_entry(trim(line.substr(3)));
      continue;
    }

    if (state_ == ParserState::OutsideEntry) {
      skip(i, "outside of an entry");
      continue;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      skip(i, "no colon");
      continue;
    }

    std::string_view name = trim(line.substr(0, colon));
    if (name.empty()) {
      skip(i, "empty attribute name");
      continue;
    }

    std::string_view raw_value = trim(line.substr(colon + 1));
    std::string value(raw_value);
    if (raw_value.empty() || options_.fold_non_empty_values)
      i = read_continuations(i, value);

    add_attribute_value(name, std::move(value));
  }

  flush_attribute();
  flush_entry();

  spdlog::debug("ldif: {} entries, {} lines skipped", entries_.size(),
                skipped_);
  return std::move(entries_);
}

} // namespace

LdifDocument parse_ldif(std::string_view content, const ParseOptions &options) {
  if (options.validate_encoding)
    validate_utf8(content);

  LineScanner lines(content);
  EntryParser parser(lines, options);

  LdifDocument doc;
  doc.entries = parser.run();
  if (!doc.entries.empty())
    doc.base_dn = extract_base_dn(doc.entries.front().dn);
  return doc;
}
