#pragma once

#include <fmt/format.h>
#include <stdexcept>
#include <string_view>

namespace lowir::diag {

// Caller errors: malformed inputs the engine cannot recover from.
[[noreturn]] inline void precondition_violated(std::string_view msg) {
  throw std::logic_error(fmt::format("precondition violated: {}", msg));
}

template <typename... Args>
inline void precondition(bool cond, fmt::format_string<Args...> fmt,
                         Args &&...args) {
  if (!cond) {
    precondition_violated(fmt::format(fmt, std::forward<Args>(args)...));
  }
}

} // namespace lowir::diag
