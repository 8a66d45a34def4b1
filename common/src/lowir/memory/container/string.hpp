#pragma once

#include <string>

namespace lowir::memory {

using string = std::string;

} // namespace lowir::memory
