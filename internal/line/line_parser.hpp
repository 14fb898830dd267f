#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "metric_record.hpp"

namespace collector::line {

enum class ParseError {
  OK = 0,
  Malformed
};

struct ParseResult {
  ParseError                  code = ParseError::OK;
  std::string                 message;
  std::optional<MetricRecord> record;

  static ParseResult Ok(MetricRecord r) {
    return {ParseError::OK, {}, std::move(r)};
  }

  static ParseResult Malformed(std::string msg) {
    return {ParseError::Malformed, std::move(msg), std::nullopt};
  }

  explicit operator bool() const {
    return code == ParseError::OK;
  }
};

/*
  Parses one line received from the device:

    measurement[,tag=value...] field=value[,field=value...]

  The device has no clock, so a trailing timestamp section is rejected:
  the collector is the only timestamp authority.

  Pure function; never throws on bad input.
*/
ParseResult Parse(std::string_view raw);

} // namespace collector::line
