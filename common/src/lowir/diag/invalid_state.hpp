#pragma once

#include <stdexcept>

namespace lowir::diag {

[[noreturn]] inline void invalid_state() {
  throw std::runtime_error("Invalid state");
}

} // namespace lowir::diag
