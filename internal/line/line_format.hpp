#pragma once

#include <string>
#include <string_view>

#include "metric_record.hpp"

namespace collector::line {

/*
  Line protocol serialization rules.

    measurement: escape ',' and ' '
    tag key/value, field key: escape ',', '=' and ' '
    string field value: double quoted, escape '"' and '\'
*/

std::string EscapeMeasurement(std::string_view name);
std::string EscapeKey(std::string_view key);
std::string QuoteString(std::string_view value);

// Integers keep their 'i' / 'u' suffix, floats use the shortest decimal
// form that parses back to the same double.
std::string FormatFieldValue(const FieldValue& value);

// measurement[,tags] fields[ timestamp]
std::string Serialize(const MetricRecord& record);

} // namespace collector::line
