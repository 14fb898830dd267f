#include "enricher.hpp"

#include "line_format.hpp"

namespace collector::line {

TagSet MergeTags(const TagSet& device_tags, const TagSet& static_tags) {
  TagSet merged = device_tags;
  for (const auto& tag : static_tags) {
    if (!HasTag(device_tags, tag.first)) {
      merged.push_back(tag);
    }
  }
  return merged;
}

std::string Enrich(const MetricRecord& record, const TagSet& static_tags, util::TimePoint now) {
  MetricRecord enriched;
  enriched.measurement = record.measurement;
  enriched.tags        = MergeTags(record.tags, static_tags);
  enriched.fields      = record.fields;
  enriched.timestamp   = now;
  return Serialize(enriched);
}

} // namespace collector::line
