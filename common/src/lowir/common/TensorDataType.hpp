#pragma once
#include "lowir/diag/unreachable.hpp"
#include <cstddef>
#include <fmt/core.h>
#include <string_view>

namespace lowir {

enum class TensorDataType {
  Bool,
  UInt8,
  Int8,
  Int16,
  Int32,
  Int64,
  Float16,
  BFloat16,
  Float32,
  Float64,
  Complex64,
};

static inline size_t size_of(TensorDataType dtype) {
  switch (dtype) {
  case TensorDataType::Bool:
  case TensorDataType::UInt8:
  case TensorDataType::Int8:
    return 1;
  case TensorDataType::Int16:
  case TensorDataType::Float16:
  case TensorDataType::BFloat16:
    return 2;
  case TensorDataType::Int32:
  case TensorDataType::Float32:
    return 4;
  case TensorDataType::Int64:
  case TensorDataType::Float64:
  case TensorDataType::Complex64:
    return 8;
  }
  diag::unreachable();
}

static inline bool is_floating_point(TensorDataType dtype) {
  switch (dtype) {
  case TensorDataType::Float16:
  case TensorDataType::BFloat16:
  case TensorDataType::Float32:
  case TensorDataType::Float64:
    return true;
  default:
    return false;
  }
}

static inline bool is_complex(TensorDataType dtype) {
  return dtype == TensorDataType::Complex64;
}

static inline std::string_view to_string(TensorDataType dtype) {
  switch (dtype) {
  case TensorDataType::Bool:
    return "bool";
  case TensorDataType::UInt8:
    return "uint8";
  case TensorDataType::Int8:
    return "int8";
  case TensorDataType::Int16:
    return "int16";
  case TensorDataType::Int32:
    return "int32";
  case TensorDataType::Int64:
    return "int64";
  case TensorDataType::Float16:
    return "float16";
  case TensorDataType::BFloat16:
    return "bfloat16";
  case TensorDataType::Float32:
    return "float32";
  case TensorDataType::Float64:
    return "float64";
  case TensorDataType::Complex64:
    return "complex64";
  }
  diag::unreachable();
}

} // namespace lowir

template <> struct fmt::formatter<lowir::TensorDataType> {
  constexpr auto parse(fmt::format_parse_context &ctx) {
    return ctx.begin(); // no custom format specifiers
  }

  template <typename FormatContext>
  auto format(lowir::TensorDataType type, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}", lowir::to_string(type));
  }
};
