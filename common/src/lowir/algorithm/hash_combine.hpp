#pragma once

#include <cstddef>
#include <functional>

namespace lowir::algorithm {

template <typename T>
inline std::size_t hash_combine(std::size_t seed, const T &v) {
  return seed ^ (std::hash<T>{}(v) + 0x9e3779b97f4a7c15ULL + (seed << 6) +
                 (seed >> 2));
}

} // namespace lowir::algorithm
