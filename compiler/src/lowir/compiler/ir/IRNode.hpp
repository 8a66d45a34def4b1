#pragma once

#include "lowir/compiler/graph/OpOverload.hpp"
#include "lowir/compiler/ir/IRNodeId.hpp"
#include "lowir/compiler/ir/Layout.hpp"
#include "lowir/memory/NodeId.hpp"
#include "lowir/memory/container/optional.hpp"
#include "lowir/memory/container/string.hpp"
#include "lowir/memory/container/vector.hpp"
#include <cassert>
#include <variant>

namespace lowir::compiler {

enum class IRNodeKind {
  StorageBox,
  Pointwise,
  Reduction,
  ComputedBuffer,
  InputBuffer,
  ConstantBuffer,
  ExternKernel,
  MultiOutput,
  ReinterpretView,
};

// Mutable indirection to the node that currently backs a tensor. Realizing or
// mutating a tensor swaps `data`, every holder of the box observes it.
struct StorageBox {
  IRNodeId data{};
};

// Deferred elementwise computation over `ranges`. `inputs` are tensor handles
// (storage boxes or views); `scalars` are literal operands appended after
// them.
struct Pointwise {
  Device device;
  TensorDataType dtype;
  memory::vector<Sym> ranges;
  memory::string fn;
  memory::vector<IRNodeId> inputs;
  memory::vector<memory::string> scalars;
};

struct Reduction {
  Device device;
  TensorDataType dtype;
  memory::vector<Sym> ranges;
  memory::vector<Sym> reductionRanges;
  memory::string reductionType;
  memory::vector<IRNodeId> inputs;
};

// A realized Pointwise or Reduction.
struct ComputedBuffer {
  memory::string name;
  Layout layout;
  IRNodeId data{};
};

struct InputBuffer {
  memory::string name;
  Layout layout;
};

struct ConstantBuffer {
  memory::string name;
  Layout layout;
};

// Call into an opaque kernel. Inputs are realized buffers.
struct ExternKernel {
  memory::string name;
  Layout layout;
  OpOverload kernel;
  memory::vector<IRNodeId> inputs;
  memory::vector<memory::string> constantArgs;
  bool fallback = false;
};

// One element of a multi-output ExternKernel.
struct MultiOutput {
  memory::string name;
  Layout layout;
  IRNodeId kernel{};
  memory::vector<std::size_t> indices;
};

// Alias of a realized storage under a different size/stride. A view held as
// a tensor handle follows the box in `data`. A view captured as an operand
// also pins `buffer`, the buffer backing the box at capture time.
struct ReinterpretView {
  IRNodeId data{};
  Layout layout;
  IRNodeId buffer{};
};

class IRNode {
public:
  IRNode(StorageBox v) : m_var(std::move(v)) {}
  IRNode(Pointwise v) : m_var(std::move(v)) {}
  IRNode(Reduction v) : m_var(std::move(v)) {}
  IRNode(ComputedBuffer v) : m_var(std::move(v)) {}
  IRNode(InputBuffer v) : m_var(std::move(v)) {}
  IRNode(ConstantBuffer v) : m_var(std::move(v)) {}
  IRNode(ExternKernel v) : m_var(std::move(v)) {}
  IRNode(MultiOutput v) : m_var(std::move(v)) {}
  IRNode(ReinterpretView v) : m_var(std::move(v)) {}

  IRNodeKind tag() const { return static_cast<IRNodeKind>(m_var.index()); }

  bool isLoops() const {
    return tag() == IRNodeKind::Pointwise || tag() == IRNodeKind::Reduction;
  }

  bool isBuffer() const {
    switch (tag()) {
    case IRNodeKind::ComputedBuffer:
    case IRNodeKind::InputBuffer:
    case IRNodeKind::ConstantBuffer:
    case IRNodeKind::ExternKernel:
    case IRNodeKind::MultiOutput:
      return true;
    default:
      return false;
    }
  }

  // Name of a buffer node.
  const memory::string &bufferName() const;
  // Layout of a buffer or view node.
  const Layout &layout() const;
  Layout &layout();

  const StorageBox &storage() const { return get<StorageBox>(); }
  StorageBox &storage() { return get<StorageBox>(); }
  const Pointwise &pointwise() const { return get<Pointwise>(); }
  const Reduction &reduction() const { return get<Reduction>(); }
  const ComputedBuffer &computed() const { return get<ComputedBuffer>(); }
  ComputedBuffer &computed() { return get<ComputedBuffer>(); }
  const InputBuffer &input() const { return get<InputBuffer>(); }
  const ConstantBuffer &constant() const { return get<ConstantBuffer>(); }
  const ExternKernel &externKernel() const { return get<ExternKernel>(); }
  ExternKernel &externKernel() { return get<ExternKernel>(); }
  const MultiOutput &multiOutput() const { return get<MultiOutput>(); }
  MultiOutput &multiOutput() { return get<MultiOutput>(); }
  const ReinterpretView &view() const { return get<ReinterpretView>(); }

  // Graph node this value was lowered from. Diagnostics only.
  memory::optional<memory::NodeId> origin;

private:
  template <typename T> const T &get() const {
    assert(std::holds_alternative<T>(m_var));
    return std::get<T>(m_var);
  }
  template <typename T> T &get() {
    assert(std::holds_alternative<T>(m_var));
    return std::get<T>(m_var);
  }

  std::variant<StorageBox, Pointwise, Reduction, ComputedBuffer, InputBuffer,
               ConstantBuffer, ExternKernel, MultiOutput, ReinterpretView>
      m_var;
};

} // namespace lowir::compiler

template <> struct fmt::formatter<lowir::compiler::IRNodeKind> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(lowir::compiler::IRNodeKind kind, FormatContext &ctx) const {
    using enum lowir::compiler::IRNodeKind;
    std::string_view name;
    switch (kind) {
    case StorageBox:
      name = "StorageBox";
      break;
    case Pointwise:
      name = "Pointwise";
      break;
    case Reduction:
      name = "Reduction";
      break;
    case ComputedBuffer:
      name = "ComputedBuffer";
      break;
    case InputBuffer:
      name = "InputBuffer";
      break;
    case ConstantBuffer:
      name = "ConstantBuffer";
      break;
    case ExternKernel:
      name = "ExternKernel";
      break;
    case MultiOutput:
      name = "MultiOutput";
      break;
    case ReinterpretView:
      name = "ReinterpretView";
      break;
    }
    return fmt::format_to(ctx.out(), "{}", name);
  }
};
