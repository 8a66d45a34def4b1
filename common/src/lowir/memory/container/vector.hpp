#pragma once

#include <vector>

namespace lowir::memory {

template <typename T> using vector = std::vector<T>;

} // namespace lowir::memory
