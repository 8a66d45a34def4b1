#include "lowir/compiler/lowering/fallback.hpp"
#include "lowir/compiler/GraphLowering.hpp"
#include "lowir/compiler/ir/render_value.hpp"
#include "lowir/compiler/shapes/sizes_strides.hpp"
#include "lowir/diag/logging.hpp"
#include <fmt/format.h>

namespace lowir::compiler {

namespace {

Layout output_layout(GraphLowering &graph, const Node &node,
                     const TensorMeta &meta, std::size_t index) {
  SizesStrides ss;
  if (meta.dynamic) {
    const memory::string source =
        index == 0 ? node.name : fmt::format("{}[{}]", node.name, index);
    ss = symbolic_sizes_strides(meta, graph.shapeEnv(), source);
  } else {
    ss = static_sizes_strides(meta);
  }
  return Layout::fixed(meta.device, meta.dtype, std::move(ss.sizes),
                       std::move(ss.strides));
}

} // namespace

Value make_fallback_kernel(GraphLowering &graph, const Node &node,
                           const OpOverload &kernel,
                           memory::span<const Value> args,
                           const KwArgs &kwargs) {
  IRGraph &ir = graph.ir();
  graph.warnFallback(kernel.dottedName());

  memory::vector<IRNodeId> inputs;
  memory::vector<memory::string> constantArgs;
  for (const Value &arg : args) {
    if (arg.isTensor()) {
      ir.realize(arg.tensor());
      inputs.push_back(ir.operand(arg.tensor()));
      continue;
    }
    arg.forEachTensor([&](IRNodeId t) {
      ir.realize(t);
      inputs.push_back(ir.operand(t));
    });
    constantArgs.push_back(render_value(ir, arg));
  }
  for (const auto &[key, arg] : kwargs) {
    arg.forEachTensor([&](IRNodeId t) {
      ir.realize(t);
      inputs.push_back(ir.operand(t));
    });
    constantArgs.push_back(fmt::format("{}={}", key, render_value(ir, arg)));
  }

  ExternKernelNode record{
      .name = {},
      .kernel = kernel.fullName(),
      .inputs = {},
      .constantArgs = constantArgs,
      .outputs = {},
  };
  for (IRNodeId in : inputs) {
    record.inputs.push_back(ir.render(in));
  }

  const NodeMeta &meta = node.meta;
  if (meta.isTensor()) {
    const IRNodeId box = ir.box(ExternKernel{
        .name = {},
        .layout = output_layout(graph, node, meta.tensor(), 0),
        .kernel = kernel,
        .inputs = std::move(inputs),
        .constantArgs = std::move(constantArgs),
        .fallback = true,
    });
    record.name = ir.registerBuffer(ir.dataOf(box));
    record.outputs.push_back(record.name);
    LOWIR_DEBUG("fallback kernel {} for {}", record.name, kernel);
    graph.recordExternKernel(std::move(record));
    return box;
  }

  Device device = Device::cpu();
  if (meta.tag() == NodeMetaKind::TensorList && !meta.tensors().empty()) {
    device = meta.tensors().front().device;
  }
  const IRNodeId kernelNode = ir.create(ExternKernel{
      .name = {},
      .layout = Layout::multiOutput(device),
      .kernel = kernel,
      .inputs = std::move(inputs),
      .constantArgs = std::move(constantArgs),
      .fallback = true,
  });
  record.name = ir.registerBuffer(kernelNode);
  LOWIR_DEBUG("fallback kernel {} for {}", record.name, kernel);

  Value result;
  switch (meta.tag()) {
  case NodeMetaKind::TensorList: {
    Value::List outputs;
    const auto &tensors = meta.tensors();
    for (std::size_t i = 0; i < tensors.size(); ++i) {
      const IRNodeId box = ir.box(MultiOutput{
          .name = {},
          .layout = output_layout(graph, node, tensors[i], i),
          .kernel = kernelNode,
          .indices = {i},
      });
      record.outputs.push_back(ir.registerBuffer(ir.dataOf(box)));
      outputs.push_back(box);
    }
    result = Value{std::move(outputs)};
    break;
  }
  case NodeMetaKind::SymInt:
    result = Value{meta.symInt()};
    break;
  case NodeMetaKind::Int:
    result = Value{Sym::Const(meta.integer())};
    break;
  case NodeMetaKind::Float:
    result = Value::Float(meta.floating());
    break;
  case NodeMetaKind::Bool:
    result = Value::Bool(meta.boolean());
    break;
  case NodeMetaKind::None:
  case NodeMetaKind::Tensor:
    break;
  }
  graph.recordExternKernel(std::move(record));
  return result;
}

LoweringFn fallback_handler(OpOverload kernel) {
  return [kernel = std::move(kernel)](GraphLowering &graph, const Node &node,
                                      memory::span<const Value> args,
                                      const KwArgs &kwargs) {
    return make_fallback_kernel(graph, node, kernel, args, kwargs);
  };
}

} // namespace lowir::compiler
