#include "include/type_inference.hpp"
#include "include/binary_heuristic.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <string>

std::string_view type_name(SemanticType t) {
  switch (t) {
  case SemanticType::String:
    return "String";
  case SemanticType::Integer:
    return "Integer";
  case SemanticType::Decimal:
    return "Decimal";
  case SemanticType::Date:
    return "Date";
  case SemanticType::Boolean:
    return "Boolean";
  case SemanticType::Email:
    return "Email";
  case SemanticType::DistinguishedName:
    return "Distinguished Name";
  case SemanticType::Telephone:
    return "Telephone";
  case SemanticType::Password:
    return "Password";
  case SemanticType::ObjectClass:
    return "Object Class";
  case SemanticType::Timestamp:
    return "Timestamp";
  case SemanticType::BinaryHash:
    return "Binary Hash";
  case SemanticType::Binary:
    return "Binary";
  }
  return "String";
}

std::string_view context_name(InferenceContext c) {
  switch (c) {
  case InferenceContext::Delimited:
    return "delimited";
  case InferenceContext::Spreadsheet:
    return "spreadsheet";
  case InferenceContext::Directory:
    return "directory";
  }
  return "delimited";
}

std::optional<InferenceContext> parse_context(std::string_view s) {
  if (s == "delimited" || s == "csv")
    return InferenceContext::Delimited;
  if (s == "spreadsheet" || s == "excel")
    return InferenceContext::Spreadsheet;
  if (s == "directory" || s == "ldif")
    return InferenceContext::Directory;
  return std::nullopt;
}

const Thresholds &thresholds_for(InferenceContext c) {
  static constexpr Thresholds delimited{0.7, 0.7, 0.9, 0.8, 15, 20};
  static constexpr Thresholds spreadsheet{0.8, 0.8, 0.9, 0.9, 10, 15};
  static constexpr Thresholds directory{0.8, 0.8, 0.9, 0.9, 15, 20};
  switch (c) {
  case InferenceContext::Spreadsheet:
    return spreadsheet;
  case InferenceContext::Directory:
    return directory;
  case InferenceContext::Delimited:
    break;
  }
  return delimited;
}

// --- Character helpers ---

static bool is_digit(char c) { return c >= '0' && c <= '9'; }

static bool is_alpha(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

static bool is_hex(char c) {
  return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

static std::string to_lower(std::string_view s) {
  std::string result;
  result.reserve(s.size());
  for (char c : s)
    result += static_cast<char>(c >= 'A' && c <= 'Z' ? c + 32 : c);
  return result;
}

static bool all_digits(std::string_view s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), is_digit);
}

static int to_int(std::string_view s) {
  int v = 0;
  for (char c : s)
    v = v * 10 + (c - '0');
  return v;
}

static bool valid_month_day(std::string_view mm, std::string_view dd) {
  int m = to_int(mm);
  int d = to_int(dd);
  return m >= 1 && m <= 12 && d >= 1 && d <= 31;
}

// --- Dates ---

// YYYY-MM-DD, YYYY/MM/DD, MM/DD/YYYY, MM-DD-YYYY
static bool is_literal_date(std::string_view s) {
  if (s.size() != 10)
    return false;
  if ((s[4] == '-' || s[4] == '/') && s[7] == s[4]) {
    if (!all_digits(s.substr(0, 4)) || !all_digits(s.substr(5, 2)) ||
        !all_digits(s.substr(8, 2)))
      return false;
    return valid_month_day(s.substr(5, 2), s.substr(8, 2));
  }
  if ((s[2] == '/' || s[2] == '-') && s[5] == s[2]) {
    if (!all_digits(s.substr(0, 2)) || !all_digits(s.substr(3, 2)) ||
        !all_digits(s.substr(6, 4)))
      return false;
    return valid_month_day(s.substr(0, 2), s.substr(3, 2));
  }
  return false;
}

// HH:MM[:SS[.fff]][Z|+HH:MM|-HHMM]
static bool is_time_of_day(std::string_view s) {
  if (s.size() < 5 || !all_digits(s.substr(0, 2)) || s[2] != ':' ||
      !all_digits(s.substr(3, 2)))
    return false;
  if (to_int(s.substr(0, 2)) > 23 || to_int(s.substr(3, 2)) > 59)
    return false;
  size_t i = 5;
  if (i < s.size() && s[i] == ':') {
    if (i + 3 > s.size() || !all_digits(s.substr(i + 1, 2)))
      return false;
    i += 3;
    if (i < s.size() && s[i] == '.') {
      size_t j = i + 1;
      while (j < s.size() && is_digit(s[j]))
        ++j;
      if (j == i + 1)
        return false;
      i = j;
    }
  }
  if (i == s.size())
    return true;
  if (s[i] == 'Z' || s[i] == 'z')
    return i + 1 == s.size();
  if (s[i] == '+' || s[i] == '-') {
    std::string_view off = s.substr(i + 1);
    if (off.size() == 5 && off[2] == ':')
      return all_digits(off.substr(0, 2)) && all_digits(off.substr(3, 2));
    return (off.size() == 4 || off.size() == 2) && all_digits(off);
  }
  return false;
}

static bool is_iso_datetime(std::string_view s) {
  if (s.size() < 16 || s[4] != '-' || s[7] != '-')
    return false;
  if (s[10] != 'T' && s[10] != 't' && s[10] != ' ')
    return false;
  return is_literal_date(s.substr(0, 10)) && is_time_of_day(s.substr(11));
}

static int month_index(std::string_view word) {
  static constexpr std::array<std::string_view, 12> months = {
      "january", "february", "march",     "april",   "may",      "june",
      "july",    "august",   "september", "october", "november", "december"};
  std::string w = to_lower(word);
  if (!w.empty() && w.back() == '.')
    w.pop_back();
  if (w.size() < 3)
    return -1;
  for (size_t i = 0; i < months.size(); ++i) {
    if (months[i] == w || (w.size() <= 4 && months[i].substr(0, w.size()) == w))
      return static_cast<int>(i);
  }
  return -1;
}

// "Jan 15, 2024", "January 15 2024", "15 Jan 2024"
static bool is_month_name_date(std::string_view s) {
  std::vector<std::string_view> words;
  size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && (s[i] == ' ' || s[i] == ','))
      ++i;
    size_t start = i;
    while (i < s.size() && s[i] != ' ' && s[i] != ',')
      ++i;
    if (i > start)
      words.push_back(s.substr(start, i - start));
  }
  if (words.size() != 3)
    return false;

  auto is_day = [](std::string_view w) {
    return w.size() <= 2 && all_digits(w) && to_int(w) >= 1 && to_int(w) <= 31;
  };
  auto is_year = [](std::string_view w) {
    return w.size() == 4 && all_digits(w);
  };

  if (month_index(words[0]) >= 0)
    return is_day(words[1]) && is_year(words[2]);
  if (is_day(words[0]) && month_index(words[1]) >= 0)
    return is_year(words[2]);
  return false;
}

bool is_date_like(std::string_view s) {
  if (s.size() < 8)
    return false;
  return is_literal_date(s) || is_iso_datetime(s) || is_month_name_date(s);
}

// --- Numbers, booleans ---

bool is_numeric_like(std::string_view s, double *out) {
  std::string cleaned;
  cleaned.reserve(s.size());
  for (char c : s) {
    if (c == ',' || c == '$' || c == '%')
      continue;
    cleaned += c;
  }
  if (cleaned.empty())
    return false;

  size_t i = 0;
  if (cleaned[0] == '-' || cleaned[0] == '+')
    ++i;
  bool has_digit = false;
  bool has_dot = false;
  for (; i < cleaned.size(); ++i) {
    char c = cleaned[i];
    if (is_digit(c)) {
      has_digit = true;
    } else if (c == '.') {
      if (has_dot)
        return false;
      has_dot = true;
    } else if ((c == 'e' || c == 'E') && has_digit) {
      ++i;
      if (i < cleaned.size() && (cleaned[i] == '+' || cleaned[i] == '-'))
        ++i;
      if (i == cleaned.size() || !all_digits(std::string_view(cleaned).substr(i)))
        return false;
      break;
    } else {
      return false;
    }
  }
  if (!has_digit)
    return false;

  double v = std::strtod(cleaned.c_str(), nullptr);
  if (!std::isfinite(v))
    return false;
  if (out)
    *out = v;
  return true;
}

bool is_boolean_like(std::string_view s) {
  if (s.empty() || s.size() > 5)
    return false;
  std::string lower = to_lower(s);
  return lower == "true" || lower == "false" || lower == "yes" ||
         lower == "no" || lower == "1" || lower == "0" || lower == "y" ||
         lower == "n" || lower == "t" || lower == "f";
}

// --- Directory value shapes ---

bool is_email_like(std::string_view s) {
  auto at = s.find('@');
  if (at == std::string_view::npos || at == 0 ||
      s.find('@', at + 1) != std::string_view::npos)
    return false;

  std::string_view local = s.substr(0, at);
  for (char c : local) {
    if (!is_alpha(c) && !is_digit(c) && c != '.' && c != '_' && c != '%' &&
        c != '+' && c != '-')
      return false;
  }

  std::string_view domain = s.substr(at + 1);
  auto dot = domain.rfind('.');
  if (dot == std::string_view::npos || dot == 0)
    return false;
  for (char c : domain.substr(0, dot)) {
    if (!is_alpha(c) && !is_digit(c) && c != '.' && c != '-')
      return false;
  }
  std::string_view tld = domain.substr(dot + 1);
  return tld.size() >= 2 && std::all_of(tld.begin(), tld.end(), is_alpha);
}

bool is_dn_like(std::string_view s) {
  if (s.empty())
    return false;

  size_t start = 0;
  for (size_t i = 0; i <= s.size(); ++i) {
    if (i < s.size() && s[i] == '\\') {
      ++i;
      continue;
    }
    if (i < s.size() && s[i] != ',')
      continue;

    std::string_view rdn = s.substr(start, i - start);
    while (!rdn.empty() && rdn.front() == ' ')
      rdn.remove_prefix(1);
    auto eq = rdn.find('=');
    if (eq == std::string_view::npos || eq == 0 || eq + 1 == rdn.size())
      return false;

    std::string_view attr = rdn.substr(0, eq);
    while (!attr.empty() && attr.back() == ' ')
      attr.remove_suffix(1);
    if (attr.empty())
      return false;
    if (is_alpha(attr[0])) {
      for (char c : attr) {
        if (!is_alpha(c) && !is_digit(c) && c != '-')
          return false;
      }
    } else {
      for (char c : attr) {
        if (!is_digit(c) && c != '.')
          return false;
      }
    }
    start = i + 1;
  }
  return true;
}

// YYYYMMDDHH[MM[SS]][(.|,)fff](Z|+HHMM|-HHMM)
bool is_generalized_time(std::string_view s) {
  size_t i = 0;
  while (i < s.size() && is_digit(s[i]))
    ++i;
  if (i != 10 && i != 12 && i != 14)
    return false;
  if (!valid_month_day(s.substr(4, 2), s.substr(6, 2)))
    return false;
  if (i < s.size() && (s[i] == '.' || s[i] == ',')) {
    size_t j = i + 1;
    while (j < s.size() && is_digit(s[j]))
      ++j;
    if (j == i + 1)
      return false;
    i = j;
  }
  if (i == s.size())
    return false;
  if (s[i] == 'Z')
    return i + 1 == s.size();
  if (s[i] == '+' || s[i] == '-')
    return s.size() - i - 1 == 4 && all_digits(s.substr(i + 1));
  return false;
}

bool is_hex_hash(std::string_view s) {
  return s.size() > 16 && std::all_of(s.begin(), s.end(), is_hex) &&
         !all_digits(s);
}

// --- Classification ---

template <typename Pred>
static double fraction_matching(const std::vector<std::string> &samples,
                                Pred pred) {
  size_t hits = 0;
  for (auto &v : samples) {
    if (pred(std::string_view(v)))
      ++hits;
  }
  return static_cast<double>(hits) / static_cast<double>(samples.size());
}

SemanticType classify_samples(const std::vector<std::string> &samples,
                              InferenceContext ctx) {
  if (samples.empty())
    return SemanticType::String;

  const Thresholds &t = thresholds_for(ctx);

  if (fraction_matching(samples, is_date_like) > t.date)
    return SemanticType::Date;

  size_t numeric = 0;
  size_t whole = 0;
  for (auto &v : samples) {
    double d;
    if (is_numeric_like(v, &d)) {
      ++numeric;
      if (std::floor(d) == d)
        ++whole;
    }
  }
  double numeric_ratio =
      static_cast<double>(numeric) / static_cast<double>(samples.size());
  if (numeric_ratio > t.numeric) {
    double whole_ratio =
        static_cast<double>(whole) / static_cast<double>(numeric);
    return whole_ratio > t.integer ? SemanticType::Integer
                                   : SemanticType::Decimal;
  }

  if (fraction_matching(samples, is_boolean_like) > t.boolean)
    return SemanticType::Boolean;

  return SemanticType::String;
}

struct NameHint {
  std::string_view fragment;
  SemanticType type;
};

static constexpr NameHint name_hints[] = {
    {"telephone", SemanticType::Telephone},
    {"phone", SemanticType::Telephone},
    {"password", SemanticType::Password},
    {"objectclass", SemanticType::ObjectClass},
    {"timestamp", SemanticType::Timestamp},
    {"photo", SemanticType::Binary},
    {"certificate", SemanticType::Binary},
    {"count", SemanticType::Integer},
    {"gidnumber", SemanticType::Integer},
    {"uidnumber", SemanticType::Integer},
    {"mail", SemanticType::Email},
};

SemanticType classify_field(std::string_view name,
                            const std::vector<std::string> &samples,
                            InferenceContext ctx, bool binary_hint) {
  if (ctx != InferenceContext::Directory)
    return classify_samples(samples, ctx);

  if (binary_hint)
    return SemanticType::Binary;

  std::string lower = to_lower(name);
  for (auto &hint : name_hints) {
    if (lower.find(hint.fragment) != std::string::npos) {
      spdlog::debug("attribute '{}' typed {} by name", name,
                    type_name(hint.type));
      return hint.type;
    }
  }

  if (samples.empty())
    return SemanticType::String;

  double limit = thresholds_for(ctx).date;
  if (fraction_matching(samples, is_email_like) > limit)
    return SemanticType::Email;
  if (fraction_matching(samples, is_dn_like) > limit)
    return SemanticType::DistinguishedName;
  if (fraction_matching(samples, is_generalized_time) > limit)
    return SemanticType::Timestamp;
  if (fraction_matching(samples, is_hex_hash) > limit)
    return SemanticType::BinaryHash;

  return classify_samples(samples, ctx);
}

std::optional<size_t>
recommended_length(SemanticType t, const std::vector<std::string> &samples,
                   InferenceContext ctx) {
  switch (t) {
  case SemanticType::String: {
    if (samples.empty())
      return 255;
    size_t longest = 0;
    for (auto &v : samples)
      longest = std::max(longest, utf8_length(v));
    return std::clamp(longest, static_cast<size_t>(10),
                      static_cast<size_t>(4000));
  }
  case SemanticType::Integer:
    return thresholds_for(ctx).integer_length;
  case SemanticType::Decimal:
    return thresholds_for(ctx).decimal_length;
  default:
    return std::nullopt;
  }
}
