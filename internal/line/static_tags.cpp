#include "static_tags.hpp"

#include <set>
#include <utility>

#include "internal/util/errors.hpp"

namespace collector::line {

namespace {

bool HasControlCharacter(const std::string& s) {
  for (unsigned char c : s) {
    if (c < 0x20 || c == 0x7f) return true;
  }
  return false;
}

// Splits one "key=value" entry, throwing on anything that cannot be
// written to the wire unambiguously.
std::pair<std::string, std::string> SplitEntry(const std::string& entry) {
  const auto eq = entry.find('=');
  if (eq == std::string::npos) {
    throw util::InvalidConfig("static tag '" + entry + "' is not of the form key=value");
  }

  auto key   = entry.substr(0, eq);
  auto value = entry.substr(eq + 1);
  if (key.empty() || value.empty()) {
    throw util::InvalidConfig("static tag '" + entry + "' has an empty key or value");
  }
  if (HasControlCharacter(key) || HasControlCharacter(value)) {
    throw util::InvalidConfig("static tag '" + key + "' contains a control character");
  }
  // a trailing backslash would escape the separator that follows it
  if (key.back() == '\\' || value.back() == '\\') {
    throw util::InvalidConfig("static tag '" + entry + "' ends its key or value with a backslash");
  }
  return {std::move(key), std::move(value)};
}

} // namespace

void ValidateStaticTags(const std::vector<std::string>& entries) {
  std::set<std::string> keys;
  for (const auto& entry : entries) {
    auto tag = SplitEntry(entry);
    if (!keys.insert(tag.first).second) {
      throw util::InvalidConfig("duplicate static tag key '" + tag.first + "'");
    }
  }
}

TagSet ParseStaticTags(const std::vector<std::string>& entries) {
  ValidateStaticTags(entries);

  TagSet tags;
  tags.reserve(entries.size());
  for (const auto& entry : entries) tags.push_back(SplitEntry(entry));
  return tags;
}

} // namespace collector::line
