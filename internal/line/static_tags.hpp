#pragma once

#include <string>
#include <vector>

#include "metric_record.hpp"

namespace collector::line {

/*
  Checks the configured "key=value" strings.

  Throws util::InvalidConfig on a missing '=', an empty key or value, a
  duplicate key, a control character, or a key or value ending in a
  backslash.
*/
void ValidateStaticTags(const std::vector<std::string>& entries);

// Validates, then returns the tags in configuration order. Keys and values
// are taken literally; escaping happens on serialization.
TagSet ParseStaticTags(const std::vector<std::string>& entries);

} // namespace collector::line
