#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "internal/util/time.hpp"

namespace collector::line {

/*
  Parsed unit of the line protocol.

  Tags and fields keep their order of appearance so that re-serialization is
  deterministic and reproduces what the device sent. Keys are unique inside
  each list (the parser rejects duplicates).
*/

using FieldValue = std::variant<int64_t, uint64_t, double, std::string, bool>;

using Tag     = std::pair<std::string, std::string>;
using TagSet  = std::vector<Tag>;
using Field   = std::pair<std::string, FieldValue>;
using FieldSet = std::vector<Field>;

struct MetricRecord {
  std::string measurement;
  TagSet      tags;
  FieldSet    fields;

  // Never set by the parser; the device has no clock.
  std::optional<util::TimePoint> timestamp;
};

bool HasTag(const TagSet& tags, const std::string& key);

} // namespace collector::line
