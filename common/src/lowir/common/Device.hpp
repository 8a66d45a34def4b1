#pragma once

#include "lowir/algorithm/hash_combine.hpp"
#include "lowir/diag/unreachable.hpp"
#include "lowir/memory/container/optional.hpp"
#include <cstdint>
#include <fmt/core.h>
#include <string_view>

namespace lowir {

enum class DeviceType {
  CPU,
  CUDA,
  XPU,
  MPS,
};

static inline std::string_view to_string(DeviceType type) {
  switch (type) {
  case DeviceType::CPU:
    return "cpu";
  case DeviceType::CUDA:
    return "cuda";
  case DeviceType::XPU:
    return "xpu";
  case DeviceType::MPS:
    return "mps";
  }
  diag::unreachable();
}

struct Device {
  DeviceType type = DeviceType::CPU;
  memory::optional<std::int32_t> index;

  static Device cpu() { return Device{DeviceType::CPU, memory::nullopt}; }
  static Device cuda(std::int32_t index = 0) {
    return Device{DeviceType::CUDA, index};
  }

  bool isCpu() const { return type == DeviceType::CPU; }

  friend bool operator==(const Device &lhs, const Device &rhs) {
    return lhs.type == rhs.type && lhs.index == rhs.index;
  }
};

} // namespace lowir

template <> struct std::hash<lowir::Device> {
  size_t operator()(const lowir::Device &d) const noexcept {
    size_t hash = std::hash<int>{}(static_cast<int>(d.type));
    return lowir::algorithm::hash_combine(hash, d.index.value_or(-1));
  }
};

template <> struct fmt::formatter<lowir::DeviceType> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(lowir::DeviceType type, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}", lowir::to_string(type));
  }
};

template <> struct fmt::formatter<lowir::Device> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const lowir::Device &device, FormatContext &ctx) const {
    if (device.index.has_value()) {
      return fmt::format_to(ctx.out(), "{}:{}", device.type, *device.index);
    }
    return fmt::format_to(ctx.out(), "{}", device.type);
  }
};
