#pragma once

#include "lowir/compiler/Options.hpp"
#include "lowir/compiler/ir/IRNode.hpp"
#include "lowir/compiler/ir/IRNodeId.hpp"
#include "lowir/compiler/ir/Layout.hpp"
#include "lowir/memory/container/hashmap.hpp"
#include "lowir/memory/container/optional.hpp"
#include "lowir/memory/container/span.hpp"
#include "lowir/memory/container/string.hpp"
#include "lowir/memory/container/string_view.hpp"
#include "lowir/memory/container/vector.hpp"
#include "lowir/symbolic/ShapeEnv.hpp"

namespace lowir::compiler {

// Arena of IR nodes produced while lowering one graph.
//
// A tensor handle is the id of a StorageBox or of a ReinterpretView. A box
// whose data is a Pointwise or Reduction is unrealized; realizing it wraps the
// computation into a ComputedBuffer and appends that buffer to the buffer
// list, where it receives the name "buf{N}".
//
// Operands of computations are bound when the computation is created (see
// operand()), so swapping the data of a box later does not change what
// existing computations read. View handles keep referring to the box and
// observe such swaps, captured views stay on the buffer they were bound to.
class IRGraph {
public:
  explicit IRGraph(ShapeEnv &env) : m_env(&env) {}

  IRGraph(const IRGraph &) = delete;
  IRGraph &operator=(const IRGraph &) = delete;

  ShapeEnv &shapeEnv() const { return *m_env; }

  IRNodeId create(IRNode node);

  // Creates `data` and a StorageBox around it, returns the box.
  IRNodeId box(IRNode data);

  const IRNode &operator[](IRNodeId id) const;
  IRNode &at(IRNodeId id);
  std::size_t size() const { return m_nodes.size(); }

  IRNodeId storageOf(IRNodeId tensor) const;
  IRNodeId dataOf(IRNodeId tensor) const;
  bool isView(IRNodeId tensor) const;
  bool isRealized(IRNodeId tensor) const;
  // Unrealized Pointwise or Reduction behind the tensor.
  bool isLoops(IRNodeId tensor) const;

  // What a computation reading `tensor` now refers to: the backing buffer,
  // the unrealized computation itself, or a copy of the view bound to the
  // buffer currently behind it.
  IRNodeId operand(IRNodeId tensor);

  // Realizes the tensor's storage and returns the backing buffer.
  IRNodeId realize(IRNodeId tensor);
  void realizeHint(IRNodeId tensor);
  void markReuse(IRNodeId tensor, std::size_t users,
                 const RealizeThresholds &thresholds);
  bool hasExceededMaxReads(IRNodeId tensor,
                           const RealizeThresholds &thresholds) const;

  memory::string registerBuffer(IRNodeId buffer);
  const memory::vector<IRNodeId> &buffers() const { return m_buffers; }
  memory::optional<IRNodeId> bufferByName(memory::string_view name) const;

  memory::vector<Sym> sizes(IRNodeId tensor) const;
  TensorDataType dtype(IRNodeId tensor) const;
  Device device(IRNodeId tensor) const;
  Sym numel(IRNodeId tensor) const;
  // Layout of a realized tensor.
  const Layout &layout(IRNodeId tensor) const;

  // Buffers loaded when computing the tensor. Unrealized producers are
  // looked through.
  memory::vector<IRNodeId> readBuffers(IRNodeId tensor) const;
  std::size_t numReads(IRNodeId tensor) const;

  // Flexible layouts of the realized tensor become fixed.
  void freezeLayout(IRNodeId tensor);
  bool isStrideOrdered(const Layout &layout,
                       memory::span<const std::size_t> order) const;
  IRNodeId requireStrideOrder(IRNodeId tensor,
                              memory::span<const std::size_t> order);
  // Realized copy of `src` into a new buffer with the given layout.
  IRNodeId copyInto(IRNodeId src, Layout layout);
  IRNodeId reinterpret(IRNodeId tensor, memory::vector<Sym> sizes,
                       memory::vector<Sym> strides,
                       Sym offset = Sym::Const(0));

  void decideLayout(IRNodeId buffer);

  // Buffer a view reads: the bound one for captured views, otherwise the
  // current data of its box.
  IRNodeId viewBuffer(IRNodeId view) const;

  // Name of the buffer backing a realized tensor.
  memory::string bufferName(IRNodeId tensor) const;
  // Expression text of a tensor, computation or buffer.
  memory::string render(IRNodeId id) const;
  memory::string renderSizes(memory::span<const Sym> syms) const;

private:
  void collectReads(IRNodeId node, memory::vector<IRNodeId> &out) const;
  void loadOperand(IRNodeId operand, memory::vector<IRNodeId> &out) const;
  bool computesFn(IRNodeId loops, memory::string_view fn) const;

  ShapeEnv *m_env;
  memory::vector<IRNode> m_nodes;
  memory::vector<IRNodeId> m_buffers;
  memory::hash_map<memory::string, IRNodeId> m_nameToBuffer;
};

} // namespace lowir::compiler
