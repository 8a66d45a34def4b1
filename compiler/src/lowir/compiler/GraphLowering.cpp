#include "lowir/compiler/GraphLowering.hpp"
#include "lowir/compiler/backend/BackendRegistry.hpp"
#include "lowir/compiler/layout/decide_layout_opt.hpp"
#include "lowir/compiler/lowering/LoweringRegistry.hpp"
#include "lowir/compiler/shapes/sizes_strides.hpp"
#include "lowir/diag/invalid_argument.hpp"
#include "lowir/diag/invalid_state.hpp"
#include "lowir/diag/logging.hpp"
#include "lowir/diag/precondition.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace lowir::compiler {

GraphLowering::GraphLowering(const Graph &graph, LoweringOptions options,
                             std::shared_ptr<ShapeEnv> shapeEnv)
    : m_graph(&graph), m_options(std::move(options)),
      m_registry(m_options.registry != nullptr ? m_options.registry
                                               : &LoweringRegistry::global()),
      m_backends(m_options.backends != nullptr ? m_options.backends
                                               : &BackendRegistry::global()),
      m_shapeEnv(shapeEnv != nullptr ? shapeEnv
                                     : std::make_shared<ShapeEnv>()),
      m_reuseShapeEnv(shapeEnv != nullptr),
      m_ir(*m_shapeEnv), m_env(graph.size()) {
  if (m_options.layoutOpt.has_value()) {
    m_layoutOpt = *m_options.layoutOpt;
  } else {
    m_layoutOpt =
        decide_layout_opt(graph, m_options.layout, m_options.runtime);
  }
  if (m_layoutOpt) {
    m_nodesPreferChannelsLast = find_nodes_prefer_channels_last(graph);
  }
  LOWIR_DEBUG("layout optimization {} ({} nodes prefer channels-last)",
              m_layoutOpt ? "enabled" : "disabled",
              m_nodesPreferChannelsLast.size());
}

void GraphLowering::run() {
  diag::set_log_level(m_options.loglevel);
  diag::precondition(m_graph->hasOutput(), "graph has no output node");
  diag::precondition(!m_finalized, "graph was already lowered");
  for (const Node &node : m_graph->nodes()) {
    runNode(node);
  }
}

const Value &GraphLowering::valueOf(memory::NodeId node) const {
  if (!node || *node >= m_env.size() || !m_env[*node].has_value()) {
    diag::invalid_argument(fmt::format("node {} has not been lowered", node));
  }
  return *m_env[*node];
}

const GraphLowering::GraphInput *
GraphLowering::graphInput(memory::string_view name) const {
  auto it = std::find_if(m_inputs.begin(), m_inputs.end(),
                         [&](const GraphInput &in) { return in.name == name; });
  if (it == m_inputs.end()) {
    return nullptr;
  }
  return &*it;
}

const Value &GraphLowering::runNode(const Node &node) {
  LOWIR_DEBUG("lowering {}", node);
  Value result;
  switch (node.kind) {
  case NodeKind::Placeholder:
    result = placeholder(node);
    break;
  case NodeKind::GetAttr:
    result = getAttr(node);
    break;
  case NodeKind::CallFunction:
    result = callNode(node);
    break;
  case NodeKind::Output:
    output(node);
    break;
  }
  m_env[*node.id] = std::move(result);
  return *m_env[*node.id];
}

Value GraphLowering::placeholder(const Node &node) {
  const NodeMeta &meta = node.meta;
  Value value;
  switch (meta.tag()) {
  case NodeMetaKind::SymInt: {
    const Sym sym = meta.symInt();
    // symbols of the example value only mean something in the env they were
    // created in
    diag::precondition(sym.isConstant() || m_reuseShapeEnv,
                       "symbolic scalar input {} requires a shared ShapeEnv",
                       node.name);
    value = sym;
    break;
  }
  case NodeMetaKind::Int:
    value = Sym::Const(meta.integer());
    break;
  case NodeMetaKind::Float:
    value = Value::Float(meta.floating());
    break;
  case NodeMetaKind::Bool:
    value = Value::Bool(meta.boolean());
    break;
  case NodeMetaKind::Tensor: {
    const TensorMeta &example = meta.tensor();
    const std::size_t tensorIndex = static_cast<std::size_t>(
        std::count_if(m_inputs.begin(), m_inputs.end(),
                      [](const GraphInput &in) { return bool(in.original); }));
    SizesStrides ss;
    if (!example.dynamic || tensorIndex < m_options.numStaticInputs) {
      ss = static_sizes_strides(example);
    } else if (m_reuseShapeEnv) {
      ss = symbolic_sizes_strides(example, *m_shapeEnv, node.name);
    } else {
      ss = symbolic_sizes_strides(
          example, *m_shapeEnv,
          fmt::format("__lowir_unknown_tensor_{}", m_shapeEnv->symbolCount()));
    }
    const IRNodeId box = m_ir.box(InputBuffer{
        .name = node.name,
        .layout = Layout::fixed(example.device, example.dtype,
                                std::move(ss.sizes), std::move(ss.strides)),
    });
    const IRNodeId buffer = m_ir.dataOf(box);
    m_ir.at(buffer).origin = node.id;
    const IRNodeId original = m_ir.create(StorageBox{buffer});
    m_inputs.push_back(GraphInput{
        .name = node.name,
        .value = box,
        .original = original,
    });
    addDevice(example.device);
    return box;
  }
  case NodeMetaKind::None:
  case NodeMetaKind::TensorList:
    diag::precondition_violated(
        fmt::format("unsupported placeholder {}", node.name));
  }
  m_inputs.push_back(GraphInput{
      .name = node.name,
      .value = value,
      .original = IRNodeId{},
  });
  return value;
}

namespace {

memory::string scalar_literal(const HostTensor &value, std::int64_t index) {
  const double item = value.item(index);
  const TensorDataType dtype = value.dtype();
  if (dtype == TensorDataType::Bool) {
    return item != 0.0 ? "True" : "False";
  }
  if (is_floating_point(dtype)) {
    return fmt::format("{}", item);
  }
  return fmt::format("{}", static_cast<std::int64_t>(item));
}

} // namespace

Value GraphLowering::getAttr(const Node &node) {
  const HostTensor *value = m_graph->attribute(node.attrTarget);
  diag::precondition(value != nullptr, "module has no attribute {}",
                     node.attrTarget);

  if (m_options.alwaysKeepTensorConstants || is_complex(value->dtype())) {
    return addTensorConstant(*value, node.attrTarget);
  }

  if (value->dim() == 0) {
    return m_ir.box(Pointwise{
        .device = value->device(),
        .dtype = value->dtype(),
        .ranges = {},
        .fn = "constant",
        .inputs = {},
        .scalars = {scalar_literal(*value, 0)},
    });
  }

  // small vectors are inlined into the consuming kernels
  if (value->dim() == 1 && value->sizes()[0] <= 8) {
    memory::vector<memory::string> items;
    for (std::int64_t i = 0; i < value->numel(); ++i) {
      items.push_back(scalar_literal(*value, i));
    }
    return m_ir.box(Pointwise{
        .device = value->device(),
        .dtype = value->dtype(),
        .ranges = {Sym::Const(value->sizes()[0])},
        .fn = "tensor",
        .inputs = {},
        .scalars = std::move(items),
    });
  }

  return addTensorConstant(*value, node.attrTarget);
}

IRNodeId
GraphLowering::addTensorConstant(const HostTensor &value,
                                 memory::optional<memory::string_view> name) {
  memory::string constant = m_constants.add(value, name);
  SizesStrides ss = static_sizes_strides(value.sizes(), value.strides());
  return m_ir.box(ConstantBuffer{
      .name = std::move(constant),
      .layout = Layout::fixed(value.device(), value.dtype(),
                              std::move(ss.sizes), std::move(ss.strides)),
  });
}

memory::string GraphLowering::constantName(memory::string_view name,
                                           const Device &device) {
  return m_constants.nameOn(name, device);
}

Value GraphLowering::lowerArgument(const Argument &arg) const {
  switch (arg.tag()) {
  case ArgumentKind::None:
    return Value{};
  case ArgumentKind::Node:
    return valueOf(arg.node());
  case ArgumentKind::Int:
    return Sym::Const(arg.integer());
  case ArgumentKind::Float:
    return Value::Float(arg.floating());
  case ArgumentKind::Bool:
    return Value::Bool(arg.boolean());
  case ArgumentKind::String:
    return Value::String(arg.string());
  case ArgumentKind::List: {
    Value::List list;
    for (const Argument &a : arg.list()) {
      list.push_back(lowerArgument(a));
    }
    return list;
  }
  }
  diag::invalid_state();
}

memory::vector<Value> GraphLowering::lowerArguments(const Node &node) const {
  memory::vector<Value> args;
  args.reserve(node.args.size());
  for (const Argument &a : node.args) {
    args.push_back(lowerArgument(a));
  }
  return args;
}

KwArgs GraphLowering::lowerKwArguments(const Node &node) const {
  KwArgs kwargs;
  for (const auto &[key, a] : node.kwargs) {
    kwargs.emplace_back(key, lowerArgument(a));
  }
  return kwargs;
}

} // namespace lowir::compiler
