#pragma once

#include "lowir/common/Device.hpp"
#include "lowir/common/TensorDataType.hpp"
#include "lowir/memory/container/vector.hpp"
#include <algorithm>
#include <cstdint>
#include <numeric>

namespace lowir::compiler {

// Example value of a tensor-producing node as recorded by the tracer.
struct TensorMeta {
  memory::vector<std::int64_t> sizes;
  memory::vector<std::int64_t> strides;
  TensorDataType dtype = TensorDataType::Float32;
  Device device;
  // The tracer observed symbolic sizes for this value.
  bool dynamic = false;

  std::size_t dim() const { return sizes.size(); }

  std::int64_t numel() const {
    std::int64_t n = 1;
    for (std::int64_t s : sizes) {
      n *= s;
    }
    return n;
  }

  // Every element maps to a distinct storage location and the storage has
  // no holes.
  bool isNonOverlappingAndDense() const {
    if (sizes.size() != strides.size()) {
      return false;
    }
    if (sizes.size() == 1) {
      return sizes[0] < 2 || strides[0] == 1;
    }
    memory::vector<std::size_t> perm(sizes.size());
    std::iota(perm.begin(), perm.end(), 0);
    std::stable_sort(perm.begin(), perm.end(),
                     [&](std::size_t a, std::size_t b) {
                       if (sizes[a] < 2) {
                         return false;
                       }
                       if (sizes[b] < 2) {
                         return true;
                       }
                       return strides[a] < strides[b];
                     });
    std::int64_t required = 1;
    for (std::size_t d : perm) {
      if (sizes[d] == 1) {
        continue;
      }
      if (strides[d] != required) {
        return false;
      }
      required *= sizes[d];
    }
    return true;
  }

  static TensorMeta contiguous(memory::vector<std::int64_t> sizes,
                               TensorDataType dtype = TensorDataType::Float32,
                               Device device = Device::cpu(),
                               bool dynamic = false) {
    memory::vector<std::int64_t> strides(sizes.size(), 1);
    std::int64_t acc = 1;
    for (std::size_t i = sizes.size(); i-- > 0;) {
      strides[i] = acc;
      acc *= std::max<std::int64_t>(sizes[i], 1);
    }
    return TensorMeta{std::move(sizes), std::move(strides), dtype,
                      std::move(device), dynamic};
  }
};

} // namespace lowir::compiler
