#include "line_format.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace collector::line {

namespace {

std::string EscapeChars(std::string_view in, std::string_view special) {
  std::string out;
  out.reserve(in.size());
  for (char c : in) {
    if (special.find(c) != std::string_view::npos) {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

struct FieldValueFormatter {
  std::string operator()(int64_t v) const {
    return std::to_string(v) + "i";
  }
  std::string operator()(uint64_t v) const {
    return std::to_string(v) + "u";
  }
  std::string operator()(double v) const {
    return fmt::format("{}", v);
  }
  std::string operator()(const std::string& v) const {
    return QuoteString(v);
  }
  std::string operator()(bool v) const {
    return v ? "true" : "false";
  }
};

} // namespace

bool HasTag(const TagSet& tags, const std::string& key) {
  return std::any_of(tags.begin(), tags.end(), [&](const Tag& tag) { return tag.first == key; });
}

std::string EscapeMeasurement(std::string_view name) {
  return EscapeChars(name, ", ");
}

std::string EscapeKey(std::string_view key) {
  return EscapeChars(key, ",= ");
}

std::string QuoteString(std::string_view value) {
  return "\"" + EscapeChars(value, "\"\\") + "\"";
}

std::string FormatFieldValue(const FieldValue& value) {
  return std::visit(FieldValueFormatter{}, value);
}

std::string Serialize(const MetricRecord& record) {
  std::string out = EscapeMeasurement(record.measurement);

  for (const auto& [key, value] : record.tags) {
    out += ',';
    out += EscapeKey(key);
    out += '=';
    out += EscapeKey(value);
  }

  out += ' ';
  bool first = true;
  for (const auto& [key, value] : record.fields) {
    if (!first) {
      out += ',';
    }
    first = false;
    out += EscapeKey(key);
    out += '=';
    out += FormatFieldValue(value);
  }

  if (record.timestamp.has_value()) {
    out += ' ';
    out += std::to_string(util::ToUnixNanos(*record.timestamp));
  }
  return out;
}

} // namespace collector::line
