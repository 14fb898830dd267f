#pragma once

#include <stdexcept>
#include <string>

namespace collector::util {

/*
  Central error types.

  Thrown during startup only; main translates them to process exit codes.
  Steady-state failures travel as Result values instead.
*/

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

class QueueUnavailable : public std::runtime_error {
 public:
  explicit QueueUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace collector::util
