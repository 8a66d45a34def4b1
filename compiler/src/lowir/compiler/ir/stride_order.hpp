#pragma once

#include "lowir/memory/container/span.hpp"
#include "lowir/memory/container/vector.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <numeric>

namespace lowir::compiler {

// A stride order assigns every dimension its rank among the strides:
// 0 is the fastest varying dimension.
using StrideOrder = memory::vector<std::size_t>;

// Channels-last for 4-D NCHW tensors: C fastest, then W, then H, then N.
static constexpr std::array<std::size_t, 4> NHWC_STRIDE_ORDER{3, 0, 2, 1};

inline StrideOrder nhwc_stride_order() {
  return StrideOrder(NHWC_STRIDE_ORDER.begin(), NHWC_STRIDE_ORDER.end());
}

inline StrideOrder get_stride_order(memory::span<const std::int64_t> strides) {
  memory::vector<std::size_t> sorted(strides.size());
  std::iota(sorted.begin(), sorted.end(), 0);
  std::stable_sort(sorted.begin(), sorted.end(),
                   [&](std::size_t a, std::size_t b) {
                     return strides[a] < strides[b];
                   });
  StrideOrder order(strides.size());
  for (std::size_t rank = 0; rank < sorted.size(); ++rank) {
    order[sorted[rank]] = rank;
  }
  return order;
}

// Dimensions in the order their strides are assigned, fastest first.
inline memory::vector<std::size_t>
stride_order_to_fill_order(memory::span<const std::size_t> order) {
  memory::vector<std::size_t> fill(order.size());
  std::iota(fill.begin(), fill.end(), 0);
  std::stable_sort(fill.begin(), fill.end(), [&](std::size_t a, std::size_t b) {
    return order[a] < order[b];
  });
  return fill;
}

inline bool is_permutation_order(memory::span<const std::size_t> order) {
  memory::vector<bool> seen(order.size(), false);
  for (std::size_t o : order) {
    if (o >= order.size() || seen[o]) {
      return false;
    }
    seen[o] = true;
  }
  return true;
}

} // namespace lowir::compiler
