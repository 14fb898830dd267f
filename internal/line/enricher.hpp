#pragma once

#include <string>

#include "metric_record.hpp"
#include "internal/util/time.hpp"

namespace collector::line {

/*
  Produces the final wire line for a parsed record.

  Static tags are appended after the device tags; when both carry the same
  key the device value is kept. `now` becomes the nanosecond timestamp.
  Only receives records that already passed Parse(), so it cannot fail.
*/
std::string Enrich(const MetricRecord& record, const TagSet& static_tags, util::TimePoint now);

// Tags merged with device precedence, in output order.
TagSet MergeTags(const TagSet& device_tags, const TagSet& static_tags);

} // namespace collector::line
