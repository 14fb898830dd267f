#include "line_parser.hpp"

#include <charconv>
#include <cmath>
#include <vector>

namespace collector::line {

namespace {

bool IsNameSpecial(char c) {
  return c == ' ' || c == ',' || c == '=';
}

bool IsStringSpecial(char c) {
  return c == '"' || c == '\\';
}

std::string_view Trim(std::string_view s) {
  const char* kWhitespace = " \t\r\n\v\f";
  const auto  begin       = s.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  const auto end = s.find_last_not_of(kWhitespace);
  return s.substr(begin, end - begin + 1);
}

// Splits on `sep` where it is neither backslash-escaped nor inside a
// double quoted string (quotes only matter when `quote_aware` is set).
bool SplitUnescaped(std::string_view in, char sep, bool quote_aware, std::vector<std::string_view>* out) {
  out->clear();
  bool   in_quotes = false;
  size_t start     = 0;
  for (size_t i = 0; i < in.size(); ++i) {
    const char c = in[i];
    if (c == '\\' && i + 1 < in.size()) {
      const char next = in[i + 1];
      if (in_quotes ? IsStringSpecial(next) : IsNameSpecial(next)) {
        ++i;
        continue;
      }
    }
    if (quote_aware && c == '"') {
      in_quotes = !in_quotes;
      continue;
    }
    if (c == sep && !in_quotes) {
      out->push_back(in.substr(start, i - start));
      start = i + 1;
    }
  }
  out->push_back(in.substr(start));
  return !in_quotes;
}

// Position of the first `c` that is not backslash-escaped. Quotes carry no
// meaning here, so this is only used outside the field section.
size_t FindUnescaped(std::string_view in, char c, size_t from = 0) {
  for (size_t i = from; i < in.size(); ++i) {
    if (in[i] == '\\' && i + 1 < in.size() && IsNameSpecial(in[i + 1])) {
      ++i;
      continue;
    }
    if (in[i] == c) {
      return i;
    }
  }
  return std::string_view::npos;
}

size_t FindUnescapedEquals(std::string_view in, size_t from = 0) {
  return FindUnescaped(in, '=', from);
}

std::string UnescapeName(std::string_view in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '\\' && i + 1 < in.size() && IsNameSpecial(in[i + 1])) {
      ++i;
    }
    out.push_back(in[i]);
  }
  return out;
}

bool ParseQuotedString(std::string_view raw, std::string* out, std::string* error) {
  out->clear();
  size_t i = 1;
  while (i < raw.size()) {
    const char c = raw[i];
    if (c == '\\' && i + 1 < raw.size() && IsStringSpecial(raw[i + 1])) {
      out->push_back(raw[i + 1]);
      i += 2;
      continue;
    }
    if (c == '"') {
      if (i != raw.size() - 1) {
        *error = "unexpected characters after closing quote";
        return false;
      }
      return true;
    }
    out->push_back(c);
    ++i;
  }
  *error = "unterminated string value";
  return false;
}

bool ParseBool(std::string_view raw, bool* out) {
  if (raw == "t" || raw == "T" || raw == "true" || raw == "True" || raw == "TRUE") {
    *out = true;
    return true;
  }
  if (raw == "f" || raw == "F" || raw == "false" || raw == "False" || raw == "FALSE") {
    *out = false;
    return true;
  }
  return false;
}

template <typename Int>
bool ParseInteger(std::string_view digits, Int* out) {
  if (digits.empty()) {
    return false;
  }
  const char* begin = digits.data();
  const char* end   = digits.data() + digits.size();
  auto [ptr, ec]    = std::from_chars(begin, end, *out);
  return ec == std::errc() && ptr == end;
}

bool ParseFloat(std::string_view raw, double* out) {
  bool has_digit = false;
  for (char c : raw) {
    if (c >= '0' && c <= '9') {
      has_digit = true;
    } else if (c != '.' && c != 'e' && c != 'E' && c != '+' && c != '-') {
      // rejects nan, inf and hex forms
      return false;
    }
  }
  if (!has_digit) {
    return false;
  }

  // from_chars takes no leading '+'
  if (raw.size() > 1 && raw.front() == '+' && raw[1] != '-' && raw[1] != '+') {
    raw.remove_prefix(1);
  }

  const char* begin = raw.data();
  const char* end   = raw.data() + raw.size();
  double      value = 0.0;
  auto [ptr, ec]    = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end || !std::isfinite(value)) {
    return false;
  }
  *out = value;
  return true;
}

bool ParseFieldValue(std::string_view raw, FieldValue* out, std::string* error) {
  if (raw.empty()) {
    *error = "empty field value";
    return false;
  }

  if (raw.front() == '"') {
    std::string value;
    if (!ParseQuotedString(raw, &value, error)) {
      return false;
    }
    *out = std::move(value);
    return true;
  }

  bool flag = false;
  if (ParseBool(raw, &flag)) {
    *out = flag;
    return true;
  }

  if (raw.back() == 'i') {
    int64_t value = 0;
    if (!ParseInteger(raw.substr(0, raw.size() - 1), &value)) {
      *error = "invalid integer value '" + std::string(raw) + "'";
      return false;
    }
    *out = value;
    return true;
  }

  if (raw.back() == 'u') {
    uint64_t value = 0;
    if (!ParseInteger(raw.substr(0, raw.size() - 1), &value)) {
      *error = "invalid unsigned value '" + std::string(raw) + "'";
      return false;
    }
    *out = value;
    return true;
  }

  double value = 0.0;
  if (!ParseFloat(raw, &value)) {
    *error = "invalid field value '" + std::string(raw) + "'";
    return false;
  }
  *out = value;
  return true;
}

bool ParseSeries(std::string_view section, MetricRecord* record, std::string* error) {
  std::vector<std::string_view> parts;
  SplitUnescaped(section, ',', false, &parts);

  record->measurement = UnescapeName(parts[0]);
  if (record->measurement.empty()) {
    *error = "empty measurement";
    return false;
  }

  for (size_t i = 1; i < parts.size(); ++i) {
    const auto part = parts[i];
    const auto eq   = FindUnescapedEquals(part);
    if (eq == std::string_view::npos) {
      *error = "tag without '='";
      return false;
    }
    if (FindUnescapedEquals(part, eq + 1) != std::string_view::npos) {
      *error = "unescaped '=' in tag value";
      return false;
    }

    auto key   = UnescapeName(part.substr(0, eq));
    auto value = UnescapeName(part.substr(eq + 1));
    if (key.empty() || value.empty()) {
      *error = "empty tag key or value";
      return false;
    }
    if (HasTag(record->tags, key)) {
      *error = "duplicate tag key '" + key + "'";
      return false;
    }
    record->tags.emplace_back(std::move(key), std::move(value));
  }
  return true;
}

bool ParseFields(std::string_view section, MetricRecord* record, std::string* error) {
  std::vector<std::string_view> parts;
  if (!SplitUnescaped(section, ',', true, &parts)) {
    *error = "unterminated string value";
    return false;
  }

  for (const auto part : parts) {
    const auto eq = FindUnescapedEquals(part);
    if (eq == std::string_view::npos) {
      *error = "field without '='";
      return false;
    }

    auto key = UnescapeName(part.substr(0, eq));
    if (key.empty()) {
      *error = "empty field key";
      return false;
    }
    for (const auto& field : record->fields) {
      if (field.first == key) {
        *error = "duplicate field key '" + key + "'";
        return false;
      }
    }

    FieldValue value;
    if (!ParseFieldValue(part.substr(eq + 1), &value, error)) {
      return false;
    }
    record->fields.emplace_back(std::move(key), std::move(value));
  }
  return true;
}

} // namespace

ParseResult Parse(std::string_view raw) {
  const auto line = Trim(raw);
  if (line.empty()) {
    return ParseResult::Malformed("empty line");
  }
  if (line.front() == '#') {
    return ParseResult::Malformed("comment line");
  }

  // Quotes delimit strings only in the field section, so the series ends
  // at the first unescaped space whatever it contains.
  const auto series_end = FindUnescaped(line, ' ');
  if (series_end == std::string_view::npos) {
    return ParseResult::Malformed("missing field section");
  }

  std::vector<std::string_view> sections;
  if (!SplitUnescaped(line.substr(series_end + 1), ' ', true, &sections)) {
    return ParseResult::Malformed("unterminated string value");
  }
  if (sections[0].empty()) {
    return ParseResult::Malformed("missing field section");
  }
  if (sections.size() > 1) {
    return ParseResult::Malformed("unexpected section after fields; timestamps are assigned by the collector");
  }

  MetricRecord record;
  std::string  error;
  if (!ParseSeries(line.substr(0, series_end), &record, &error) || !ParseFields(sections[0], &record, &error)) {
    return ParseResult::Malformed(error);
  }
  if (record.fields.empty()) {
    return ParseResult::Malformed("no fields");
  }
  return ParseResult::Ok(std::move(record));
}

} // namespace collector::line
