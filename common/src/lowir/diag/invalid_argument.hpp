#pragma once

#include <stdexcept>
#include <string>

namespace lowir::diag {

[[noreturn]] inline void invalid_argument(const std::string &msg = {}) {
  if (msg.empty()) {
    throw std::invalid_argument("Invalid argument");
  }
  throw std::invalid_argument(msg);
}

} // namespace lowir::diag
