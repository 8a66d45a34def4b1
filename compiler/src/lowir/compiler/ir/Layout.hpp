#pragma once

#include "lowir/common/Device.hpp"
#include "lowir/common/TensorDataType.hpp"
#include "lowir/compiler/ir/IRNodeId.hpp"
#include "lowir/compiler/ir/stride_order.hpp"
#include "lowir/memory/container/vector.hpp"
#include "lowir/symbolic/ShapeEnv.hpp"
#include "lowir/symbolic/Sym.hpp"

namespace lowir::compiler {

enum class LayoutKind {
  // Strides may still be changed by a consumer.
  Flexible,
  Fixed,
  // Writes into the storage of another buffer.
  Mutation,
  // Placeholder layout of a kernel with several outputs.
  MultiOutput,
};

struct Layout {
  LayoutKind kind = LayoutKind::Flexible;
  Device device;
  TensorDataType dtype = TensorDataType::Float32;
  memory::vector<Sym> sizes;
  memory::vector<Sym> strides;
  Sym offset;
  // Mutated buffer of a Mutation layout.
  IRNodeId target{};

  bool isFlexible() const { return kind == LayoutKind::Flexible; }
  bool isFixed() const {
    return kind == LayoutKind::Fixed || kind == LayoutKind::Mutation;
  }

  static memory::vector<Sym> contiguousStrides(memory::span<const Sym> sizes,
                                               ShapeEnv &env);

  static memory::vector<Sym> strideOrdered(memory::span<const Sym> sizes,
                                           memory::span<const std::size_t> order,
                                           ShapeEnv &env);

  static Layout flexible(Device device, TensorDataType dtype,
                         memory::vector<Sym> sizes, ShapeEnv &env);

  static Layout fixed(Device device, TensorDataType dtype,
                      memory::vector<Sym> sizes, memory::vector<Sym> strides,
                      Sym offset = Sym::Const(0));

  static Layout mutation(IRNodeId target, const Layout &targetLayout);

  static Layout multiOutput(Device device);

  Layout asFixed() const {
    Layout l = *this;
    if (l.kind == LayoutKind::Flexible) {
      l.kind = LayoutKind::Fixed;
    }
    return l;
  }

  memory::vector<std::int64_t> strideHints(const ShapeEnv &env) const {
    return env.hints(strides);
  }
};

} // namespace lowir::compiler
