#pragma once

#include <string_view>

namespace lowir::memory {

using string_view = std::string_view;

} // namespace lowir::memory
