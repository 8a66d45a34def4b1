#include "lowir/common/HostTensor.hpp"
#include "lowir/diag/precondition.hpp"
#include <algorithm>
#include <bit>
#include <cstring>
#include <fmt/format.h>

namespace lowir {

namespace {

float half_to_float(std::uint16_t h) {
  const std::uint32_t sign = static_cast<std::uint32_t>(h & 0x8000) << 16;
  std::uint32_t exponent = (h >> 10) & 0x1F;
  std::uint32_t mantissa = h & 0x3FF;
  std::uint32_t bits;
  if (exponent == 0) {
    if (mantissa == 0) {
      bits = sign;
    } else {
      // subnormal: renormalize
      exponent = 127 - 15 + 1;
      while ((mantissa & 0x400) == 0) {
        mantissa <<= 1;
        --exponent;
      }
      mantissa &= 0x3FF;
      bits = sign | (exponent << 23) | (mantissa << 13);
    }
  } else if (exponent == 0x1F) {
    bits = sign | 0x7F800000 | (mantissa << 13);
  } else {
    bits = sign | ((exponent + 127 - 15) << 23) | (mantissa << 13);
  }
  return std::bit_cast<float>(bits);
}

template <typename T> T load(const std::byte *ptr) {
  T v;
  std::memcpy(&v, ptr, sizeof(T));
  return v;
}

} // namespace

HostTensor::HostTensor(memory::vector<std::int64_t> sizes,
                       memory::vector<std::int64_t> strides,
                       TensorDataType dtype, Device device,
                       memory::vector<std::byte> storage)
    : m_sizes(std::move(sizes)), m_strides(std::move(strides)),
      m_dtype(dtype), m_device(std::move(device)),
      m_storage(std::move(storage)) {
  diag::precondition(m_sizes.size() == m_strides.size(),
                     "tensor rank mismatch: {} sizes vs {} strides",
                     m_sizes.size(), m_strides.size());
  std::int64_t extent = 0;
  for (std::size_t d = 0; d < m_sizes.size(); ++d) {
    diag::precondition(m_sizes[d] >= 0, "negative tensor extent {}",
                       m_sizes[d]);
    diag::precondition(m_strides[d] >= 0, "negative tensor stride {}",
                       m_strides[d]);
    if (m_sizes[d] == 0) {
      extent = -1;
      break;
    }
    extent += (m_sizes[d] - 1) * m_strides[d];
  }
  const std::size_t required =
      static_cast<std::size_t>(extent + 1) * size_of(m_dtype);
  diag::precondition(m_storage.size() >= required,
                     "tensor storage holds {} bytes, {} required",
                     m_storage.size(), required);
}

memory::vector<std::int64_t>
HostTensor::contiguousStrides(memory::span<const std::int64_t> sizes) {
  memory::vector<std::int64_t> strides(sizes.size(), 1);
  std::int64_t acc = 1;
  for (std::size_t i = sizes.size(); i-- > 0;) {
    strides[i] = acc;
    acc *= std::max<std::int64_t>(sizes[i], 1);
  }
  return strides;
}

HostTensor HostTensor::fromFloat32(memory::vector<std::int64_t> sizes,
                                    memory::span<const float> values,
                                    Device device) {
  memory::vector<std::byte> storage(values.size_bytes());
  std::memcpy(storage.data(), values.data(), values.size_bytes());
  auto strides = contiguousStrides(sizes);
  return HostTensor(std::move(sizes), std::move(strides),
                    TensorDataType::Float32, std::move(device),
                    std::move(storage));
}

HostTensor HostTensor::fromInt64(memory::vector<std::int64_t> sizes,
                                  memory::span<const std::int64_t> values,
                                  Device device) {
  memory::vector<std::byte> storage(values.size_bytes());
  std::memcpy(storage.data(), values.data(), values.size_bytes());
  auto strides = contiguousStrides(sizes);
  return HostTensor(std::move(sizes), std::move(strides),
                    TensorDataType::Int64, std::move(device),
                    std::move(storage));
}

HostTensor HostTensor::scalarFloat32(float value, Device device) {
  const float values[] = {value};
  return fromFloat32({}, values, std::move(device));
}

std::int64_t HostTensor::numel() const {
  std::int64_t n = 1;
  for (std::int64_t s : m_sizes) {
    n *= s;
  }
  return n;
}

std::int64_t HostTensor::storageOffset(std::int64_t logicalIndex) const {
  std::int64_t offset = 0;
  for (std::size_t d = m_sizes.size(); d-- > 0;) {
    const std::int64_t size = m_sizes[d];
    offset += (logicalIndex % size) * m_strides[d];
    logicalIndex /= size;
  }
  return offset;
}

double HostTensor::item(std::int64_t logicalIndex) const {
  diag::precondition(logicalIndex >= 0 && logicalIndex < numel(),
                     "element index {} out of range for {} elements",
                     logicalIndex, numel());
  const std::byte *ptr =
      m_storage.data() + storageOffset(logicalIndex) * size_of(m_dtype);
  switch (m_dtype) {
  case TensorDataType::Bool:
    return load<std::uint8_t>(ptr) != 0 ? 1.0 : 0.0;
  case TensorDataType::UInt8:
    return load<std::uint8_t>(ptr);
  case TensorDataType::Int8:
    return load<std::int8_t>(ptr);
  case TensorDataType::Int16:
    return load<std::int16_t>(ptr);
  case TensorDataType::Int32:
    return load<std::int32_t>(ptr);
  case TensorDataType::Int64:
    return static_cast<double>(load<std::int64_t>(ptr));
  case TensorDataType::Float16:
    return half_to_float(load<std::uint16_t>(ptr));
  case TensorDataType::BFloat16:
    return std::bit_cast<float>(
        static_cast<std::uint32_t>(load<std::uint16_t>(ptr)) << 16);
  case TensorDataType::Float32:
    return load<float>(ptr);
  case TensorDataType::Float64:
    return load<double>(ptr);
  case TensorDataType::Complex64:
    diag::precondition_violated("item() on a complex tensor");
  }
  diag::unreachable();
}

bool HostTensor::sameContent(const HostTensor &other) const {
  if (m_sizes != other.m_sizes || m_strides != other.m_strides ||
      m_dtype != other.m_dtype || !(m_device == other.m_device)) {
    return false;
  }
  const std::size_t elemSize = size_of(m_dtype);
  const std::int64_t n = numel();
  for (std::int64_t i = 0; i < n; ++i) {
    const std::byte *lhs = m_storage.data() + storageOffset(i) * elemSize;
    const std::byte *rhs =
        other.m_storage.data() + other.storageOffset(i) * elemSize;
    if (std::memcmp(lhs, rhs, elemSize) != 0) {
      return false;
    }
  }
  return true;
}

HostTensor HostTensor::to(const Device &device) const {
  HostTensor copy = *this;
  copy.m_device = device;
  return copy;
}

SHA256 HostTensor::contentHash() const {
  SHA256Builder builder;
  builder.update(to_string(m_dtype));
  builder.update(fmt::format("{}", m_device));
  builder.update_uint64(m_sizes.size());
  for (std::size_t d = 0; d < m_sizes.size(); ++d) {
    builder.update_int64(m_sizes[d]);
    builder.update_int64(m_strides[d]);
  }
  const std::size_t elemSize = size_of(m_dtype);
  const std::int64_t n = numel();
  for (std::int64_t i = 0; i < n; ++i) {
    const auto *ptr = reinterpret_cast<const uint8_t *>(
        m_storage.data() + storageOffset(i) * elemSize);
    builder.update(std::span<const uint8_t>(ptr, elemSize));
  }
  return builder.finalize();
}

} // namespace lowir
