#pragma once

#include "lowir/common/Device.hpp"
#include "lowir/common/SHA256.hpp"
#include "lowir/common/TensorDataType.hpp"
#include "lowir/memory/container/span.hpp"
#include "lowir/memory/container/vector.hpp"
#include <cstddef>
#include <cstdint>

namespace lowir {

// A concrete tensor value living in host memory. Used for module attributes
// (weights, buffers) and for constants registered during lowering.
class HostTensor {
public:
  HostTensor() = default;

  HostTensor(memory::vector<std::int64_t> sizes,
             memory::vector<std::int64_t> strides, TensorDataType dtype,
             Device device, memory::vector<std::byte> storage);

  static memory::vector<std::int64_t>
  contiguousStrides(memory::span<const std::int64_t> sizes);

  static HostTensor fromFloat32(memory::vector<std::int64_t> sizes,
                                 memory::span<const float> values,
                                 Device device = Device::cpu());

  static HostTensor fromInt64(memory::vector<std::int64_t> sizes,
                               memory::span<const std::int64_t> values,
                               Device device = Device::cpu());

  static HostTensor scalarFloat32(float value, Device device = Device::cpu());

  const memory::vector<std::int64_t> &sizes() const { return m_sizes; }
  const memory::vector<std::int64_t> &strides() const { return m_strides; }
  TensorDataType dtype() const { return m_dtype; }
  const Device &device() const { return m_device; }
  memory::span<const std::byte> storage() const { return m_storage; }

  std::size_t dim() const { return m_sizes.size(); }
  std::int64_t numel() const;

  // Element at the given row-major logical index, widened to double.
  double item(std::int64_t logicalIndex = 0) const;

  // Same shape, stride, dtype, device and bitwise-identical elements.
  bool sameContent(const HostTensor &other) const;

  HostTensor to(const Device &device) const;

  // Stable digest over metadata and element bytes.
  SHA256 contentHash() const;

private:
  std::int64_t storageOffset(std::int64_t logicalIndex) const;

  memory::vector<std::int64_t> m_sizes;
  memory::vector<std::int64_t> m_strides;
  TensorDataType m_dtype = TensorDataType::Float32;
  Device m_device;
  memory::vector<std::byte> m_storage;
};

} // namespace lowir
