#include "lowir/compiler/GraphLowering.hpp"
#include "lowir/compiler/graph/OpOverload.hpp"
#include "lowir/compiler/ir/render_value.hpp"
#include "lowir/compiler/ir/stride_order.hpp"
#include "lowir/compiler/lowering/LoweringRegistry.hpp"
#include "lowir/compiler/lowering/builtin/arguments.hpp"
#include "lowir/compiler/lowering/builtin/builtin.hpp"
#include "lowir/diag/logging.hpp"

namespace lowir::compiler {

namespace {

IRNodeId make_extern(GraphLowering &graph, const OpOverload &kernel,
                     memory::span<const IRNodeId> tensors,
                     memory::vector<memory::string> constantArgs,
                     Layout layout) {
  IRGraph &ir = graph.ir();
  memory::vector<IRNodeId> inputs;
  for (IRNodeId t : tensors) {
    ir.realize(t);
    inputs.push_back(ir.operand(t));
  }
  const IRNodeId box = ir.box(ExternKernel{
      .name = {},
      .layout = std::move(layout),
      .kernel = kernel,
      .inputs = std::move(inputs),
      .constantArgs = std::move(constantArgs),
      .fallback = false,
  });
  ir.registerBuffer(ir.dataOf(box));
  return box;
}

// Output extent of a transposed convolution along one axis.
Sym transposed_extent(ShapeEnv &env, Sym in, std::int64_t kernel,
                      std::int64_t padding, std::int64_t stride,
                      std::int64_t dilation, std::int64_t outputPadding) {
  Sym out = env.mul(env.sub(in, Sym::Const(1)), Sym::Const(stride));
  return env.add(out, Sym::Const(dilation * (kernel - 1) + outputPadding + 1 -
                                 2 * padding));
}

Value lower_convolution(GraphLowering &graph, const Node &node,
                        memory::span<const Value> args, const KwArgs &) {
  IRGraph &ir = graph.ir();
  ShapeEnv &env = ir.shapeEnv();
  if (args.size() < 9) {
    diag::invalid_argument("convolution expects 9 arguments");
  }
  IRNodeId x = tensor_arg(args, 0);
  IRNodeId weight = tensor_arg(args, 1);
  memory::optional<IRNodeId> bias;
  if (args[2].isTensor()) {
    bias = args[2].tensor();
  }

  const auto xSizes = ir.sizes(x);
  const auto wSizes = ir.sizes(weight);
  if (xSizes.size() < 3 || xSizes.size() != wSizes.size()) {
    diag::invalid_argument(fmt::format(
        "convolution input of rank {} with weight of rank {}", xSizes.size(),
        wSizes.size()));
  }
  const std::size_t spatial = xSizes.size() - 2;
  const auto stride = const_ints_value(args[3], spatial);
  const auto padding = const_ints_value(args[4], spatial);
  const auto dilation = const_ints_value(args[5], spatial);
  const bool transposed = bool_value(args[6]);
  const auto outputPadding = const_ints_value(args[7], spatial);
  const std::int64_t groups = const_int_value(args[8]);

  memory::vector<Sym> outSizes{xSizes[0]};
  if (transposed) {
    outSizes.push_back(env.mul(wSizes[1], Sym::Const(groups)));
  } else {
    outSizes.push_back(wSizes[0]);
  }
  for (std::size_t i = 0; i < spatial; ++i) {
    const std::int64_t k = env.hint(wSizes[2 + i]);
    if (transposed) {
      outSizes.push_back(transposed_extent(env, xSizes[2 + i], k, padding[i],
                                           stride[i], dilation[i],
                                           outputPadding[i]));
    } else {
      outSizes.push_back(
          env.pool(xSizes[2 + i], k, padding[i], stride[i], dilation[i]));
    }
  }

  StrideOrder order;
  if (graph.layoutOpt() && xSizes.size() == 4 &&
      graph.prefersChannelsLast(node.id)) {
    graph.countChannelsLastConv();
    order = nhwc_stride_order();
    x = ir.requireStrideOrder(x, order);
    weight = ir.requireStrideOrder(weight, order);
  } else if (node.meta.isTensor() &&
             node.meta.tensor().dim() == outSizes.size()) {
    order = get_stride_order(node.meta.tensor().strides);
  } else {
    order.resize(outSizes.size());
    for (std::size_t d = 0; d < outSizes.size(); ++d) {
      order[d] = outSizes.size() - 1 - d;
    }
  }

  memory::vector<IRNodeId> inputs{x, weight};
  if (bias) {
    inputs.push_back(*bias);
  }
  memory::vector<memory::string> constantArgs;
  for (std::size_t i = 3; i < 9; ++i) {
    constantArgs.push_back(render_value(ir, args[i]));
  }
  auto strides = Layout::strideOrdered(outSizes, order, env);
  Layout layout = Layout::fixed(ir.device(x), ir.dtype(x), std::move(outSizes),
                                std::move(strides));
  return make_extern(graph, node.target, inputs, std::move(constantArgs),
                     std::move(layout));
}

enum class MatmulKind {
  Mm,
  Addmm,
  Bmm,
};

LoweringFn matmul(MatmulKind kind,
                  memory::optional<TensorDataType> outDtype = {}) {
  return [kind, outDtype](GraphLowering &graph, const Node &node,
                          memory::span<const Value> args,
                          const KwArgs &) -> Value {
    IRGraph &ir = graph.ir();
    const std::size_t first = kind == MatmulKind::Addmm ? 1 : 0;
    const IRNodeId a = tensor_arg(args, first);
    const IRNodeId b = tensor_arg(args, first + 1);
    const auto aSizes = ir.sizes(a);
    const auto bSizes = ir.sizes(b);
    const std::size_t rank = kind == MatmulKind::Bmm ? 3 : 2;
    if (aSizes.size() != rank || bSizes.size() != rank) {
      diag::invalid_argument(
          fmt::format("{} expects rank {} operands", node.target, rank));
    }
    const Sym k1 = aSizes[rank - 1];
    const Sym k2 = bSizes[rank - 2];
    if (!(k1 == k2) &&
        ir.shapeEnv().hint(k1) != ir.shapeEnv().hint(k2)) {
      diag::invalid_argument(fmt::format(
          "{}: mat1 and mat2 shapes cannot be multiplied ({} vs {})",
          node.target, ir.shapeEnv().to_string(k1),
          ir.shapeEnv().to_string(k2)));
    }
    memory::vector<Sym> sizes;
    if (kind == MatmulKind::Bmm) {
      sizes.push_back(aSizes[0]);
    }
    sizes.push_back(aSizes[rank - 2]);
    sizes.push_back(bSizes[rank - 1]);

    memory::vector<IRNodeId> inputs;
    if (kind == MatmulKind::Addmm) {
      inputs.push_back(tensor_arg(args, 0));
    }
    inputs.push_back(a);
    inputs.push_back(b);
    memory::vector<memory::string> constantArgs;
    for (std::size_t i = first + 2; i < args.size(); ++i) {
      constantArgs.push_back(render_value(ir, args[i]));
    }
    Layout layout = Layout::flexible(ir.device(a), outDtype.value_or(ir.dtype(a)),
                                     std::move(sizes), ir.shapeEnv());
    return make_extern(graph, node.target, inputs, std::move(constantArgs),
                       std::move(layout));
  };
}

} // namespace

void register_extern_lowerings(LoweringRegistry &registry) {
  const OpOverload convolution = ops::aten("convolution");
  registry.registerLowering(convolution, lower_convolution);
  registry.addNeedsRealizedInputs(convolution);

  const OpOverload mm = ops::aten("mm");
  const OpOverload addmm = ops::aten("addmm");
  const OpOverload bmm = ops::aten("bmm");
  const OpOverload intMm = ops::aten("_int_mm");
  registry.registerLowering(mm, matmul(MatmulKind::Mm));
  registry.registerLowering(addmm, matmul(MatmulKind::Addmm));
  registry.registerLowering(bmm, matmul(MatmulKind::Bmm));
  registry.registerLowering(intMm,
                            matmul(MatmulKind::Mm, TensorDataType::Int32));
  for (const OpOverload &op : {mm, addmm, bmm, intMm}) {
    registry.addNeedsRealizedInputs(op);
  }
}

} // namespace lowir::compiler
