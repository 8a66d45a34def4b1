#pragma once

#include <fmt/format.h>
#include <stdexcept>
#include <string>

namespace lowir::diag {

[[noreturn]] inline void unreachable(const std::string &msg = {}) {
  if (msg.empty()) {
    throw std::logic_error("unreachable");
  } else {
    throw std::logic_error(fmt::format("unreachable: {}", msg));
  }
}

} // namespace lowir::diag
