#pragma once

#include "lowir/common/HostTensor.hpp"
#include "lowir/compiler/Options.hpp"
#include "lowir/compiler/backend/Backend.hpp"
#include "lowir/compiler/backend/CodeCache.hpp"
#include "lowir/compiler/constants/ConstantTable.hpp"
#include "lowir/compiler/graph/Graph.hpp"
#include "lowir/compiler/ir/IRGraph.hpp"
#include "lowir/compiler/ir/Value.hpp"
#include "lowir/compiler/lowering/ExternKernelNode.hpp"
#include "lowir/compiler/lowering/LoweringError.hpp"
#include "lowir/memory/NodeId.hpp"
#include "lowir/memory/container/hashmap.hpp"
#include "lowir/memory/container/hashset.hpp"
#include "lowir/memory/container/optional.hpp"
#include "lowir/memory/container/span.hpp"
#include "lowir/memory/container/string.hpp"
#include "lowir/memory/container/string_view.hpp"
#include "lowir/memory/container/vector.hpp"
#include "lowir/symbolic/ShapeEnv.hpp"
#include <memory>

namespace lowir::compiler {

class LoweringRegistry;
class BackendRegistry;

// Lowers one traced Graph into buffers, views and constants.
//
// Nodes are visited once in trace order. Every call node is dispatched to a
// lowering, after which the materialization policy decides which results are
// written to buffers. The output node rewrites mutated inputs and finalizes
// all buffer layouts, after which the result can be handed to a backend.
//
// An instance is single threaded. Several instances may run concurrently as
// long as they only share the (synchronized) registries and ShapeEnv.
class GraphLowering {
public:
  struct GraphInput {
    memory::string name;
    // Current value. For tensors this box is redirected by in-place updates.
    Value value;
    // Box that always holds the InputBuffer; null for scalar inputs.
    IRNodeId original{};
  };

  explicit GraphLowering(const Graph &graph, LoweringOptions options = {},
                         std::shared_ptr<ShapeEnv> shapeEnv = nullptr);

  GraphLowering(const GraphLowering &) = delete;
  GraphLowering &operator=(const GraphLowering &) = delete;

  void run();

  // Dispatches a call node to its lowering. Errors are returned, not thrown.
  LoweringResult callFunction(const Node &node, memory::span<const Value> args,
                              const KwArgs &kwargs);

  const Graph &graph() const { return *m_graph; }
  const LoweringOptions &options() const { return m_options; }
  LoweringRegistry &registry() const { return *m_registry; }
  ShapeEnv &shapeEnv() const { return *m_shapeEnv; }
  bool reusesShapeEnv() const { return m_reuseShapeEnv; }
  IRGraph &ir() { return m_ir; }
  const IRGraph &ir() const { return m_ir; }

  bool layoutOpt() const { return m_layoutOpt; }
  bool prefersChannelsLast(memory::NodeId node) const {
    return m_nodesPreferChannelsLast.contains(node);
  }
  const memory::hash_set<memory::NodeId> &nodesPreferChannelsLast() const {
    return m_nodesPreferChannelsLast;
  }
  void countChannelsLastConv() { ++m_numChannelsLastConv; }
  std::size_t numChannelsLastConv() const { return m_numChannelsLastConv; }

  // Lowered value of an already visited node.
  const Value &valueOf(memory::NodeId node) const;

  const memory::vector<GraphInput> &graphInputs() const { return m_inputs; }
  const GraphInput *graphInput(memory::string_view name) const;
  const memory::vector<Value> &graphOutputs() const { return m_outputs; }
  const memory::hash_set<memory::string> &mutatedInputs() const {
    return m_mutatedInputs;
  }
  const memory::vector<std::size_t> &mutatedInputIdxs() const {
    return m_mutatedInputIdxs;
  }
  const memory::hash_set<IRNodeId> &mutatedBuffers() const {
    return m_mutatedBuffers;
  }
  // Device types and indices of inputs and buffers. Complete once the graph
  // is lowered.
  const memory::hash_set<DeviceType> &deviceTypes() const {
    return m_deviceTypes;
  }
  const memory::hash_set<std::int32_t> &deviceIdxs() const {
    return m_deviceIdxs;
  }

  ConstantTable &constants() { return m_constants; }
  const ConstantTable &constants() const { return m_constants; }
  // Registers `value` in the constant table and returns a tensor handle to
  // the ConstantBuffer.
  IRNodeId addTensorConstant(const HostTensor &value,
                             memory::optional<memory::string_view> name = {});
  memory::string constantName(memory::string_view name, const Device &device);

  // Makes `dst` hold the value of `src` from now on. Readers recorded for the
  // buffer previously behind `dst` are realized first.
  void mutateTo(IRNodeId dst, IRNodeId src);
  void markBufferMutated(IRNodeId buffer);
  void markBufferMutated(memory::string_view name);
  // Records every tensor in `value` as reader of the buffers it loads.
  void registerUsersOf(const Value &value);
  memory::span<const IRNodeId> readersOf(IRNodeId buffer) const;

  void warnFallback(memory::string_view name);
  const memory::hash_set<memory::string> &warnedFallbacks() const {
    return m_warnedFallbacks;
  }
  void recordExternKernel(ExternKernelNode node);
  memory::span<const ExternKernelNode> externKernelNodes() const {
    return m_externKernelNodes;
  }

  // Buffer node registered under `name`, or the InputBuffer of an input.
  memory::optional<IRNodeId> getBuffer(memory::string_view name) const;
  TensorDataType getDtype(memory::string_view name) const;
  Sym getNumel(memory::string_view name) const;
  // Unspecialized scalars are passed as 0-d cpu tensors.
  bool isUnspecArg(memory::string_view name) const;
  memory::string registerList(memory::span<const memory::string> names);
  memory::vector<memory::string> getOutputNames() const;

  void validateCanGenerateCppWrapper() const;
  // Selects the wrapper backend from the touched device types.
  DeviceType initWrapperCode();
  GeneratedCode codegen();
  LoadedModule compileToModule(ICodeCache &cache);
  CompiledArtifact compileToFn(ICodeCache &cache);

  const memory::optional<LoadedModule> &cachedModule() const {
    return m_module;
  }

private:
  const Value &runNode(const Node &node);
  Value placeholder(const Node &node);
  Value getAttr(const Node &node);
  Value callNode(const Node &node);
  void output(const Node &node);
  void finalize();
  void addDevice(const Device &device);

  Value lowerArgument(const Argument &arg) const;
  memory::vector<Value> lowerArguments(const Node &node) const;
  KwArgs lowerKwArguments(const Node &node) const;

  Value enforceStrideOrder(const Node &node, Value result);
  Value applyRealizationPolicy(const Node &node, Value result);
  void tagOrigin(const Node &node, const Value &result);
  bool needsFixedLayout(const OpOverload &op) const;
  bool isSymbolicScalarOp(const OpOverload &op) const;

  const Graph *m_graph;
  LoweringOptions m_options;
  LoweringRegistry *m_registry;
  BackendRegistry *m_backends;
  std::shared_ptr<ShapeEnv> m_shapeEnv;
  bool m_reuseShapeEnv;
  IRGraph m_ir;
  ConstantTable m_constants;

  bool m_layoutOpt = false;
  memory::hash_set<memory::NodeId> m_nodesPreferChannelsLast;
  std::size_t m_numChannelsLastConv = 0;

  memory::vector<memory::optional<Value>> m_env;
  memory::vector<GraphInput> m_inputs;
  memory::vector<Value> m_outputs;
  memory::hash_set<DeviceType> m_deviceTypes;
  memory::hash_set<std::int32_t> m_deviceIdxs;

  memory::hash_map<IRNodeId, memory::vector<IRNodeId>> m_bufferReaders;
  memory::hash_set<IRNodeId> m_mutatedBuffers;
  memory::hash_set<memory::string> m_mutatedInputs;
  memory::vector<std::size_t> m_mutatedInputIdxs;

  memory::hash_set<memory::string> m_warnedFallbacks;
  memory::vector<ExternKernelNode> m_externKernelNodes;
  memory::hash_map<memory::string, memory::vector<memory::string>> m_lists;

  bool m_finalized = false;
  memory::optional<DeviceType> m_wrapperDevice;
  memory::optional<LoadedModule> m_module;
};

} // namespace lowir::compiler
