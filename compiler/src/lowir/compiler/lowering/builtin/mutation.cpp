#include "lowir/compiler/GraphLowering.hpp"
#include "lowir/compiler/graph/OpOverload.hpp"
#include "lowir/compiler/lowering/LoweringRegistry.hpp"
#include "lowir/compiler/lowering/builtin/arguments.hpp"
#include "lowir/compiler/lowering/builtin/builtin.hpp"
#include "lowir/compiler/lowering/builtin/pointwise.hpp"

namespace lowir::compiler {

namespace {

Value lower_copy_(GraphLowering &graph, const Node &,
                  memory::span<const Value> args, const KwArgs &) {
  IRGraph &ir = graph.ir();
  const IRNodeId self = tensor_arg(args, 0);
  const IRNodeId src = tensor_arg(args, 1);
  const auto sizes = ir.sizes(self);
  broadcast_shapes(ir.shapeEnv(), sizes, ir.sizes(src));
  const IRNodeId value = ir.box(Pointwise{
      .device = ir.device(self),
      .dtype = ir.dtype(self),
      .ranges = sizes,
      .fn = "copy",
      .inputs = {load_operand(ir, src)},
      .scalars = {},
  });
  graph.mutateTo(self, value);
  return self;
}

Value lower_add_(GraphLowering &graph, const Node &,
                 memory::span<const Value> args, const KwArgs &kwargs) {
  IRGraph &ir = graph.ir();
  const IRNodeId self = tensor_arg(args, 0);
  if (args.size() < 2) {
    diag::invalid_argument("add_ expects two operands");
  }
  Value other = args[1];
  if (const Value *alpha = arg_or_kwarg(args, kwargs, 2, "alpha")) {
    other = scale_by_alpha(graph, other, *alpha);
  }
  const Value operands[] = {args[0], other};
  // in-place results keep the destination dtype
  const IRNodeId value =
      make_pointwise(graph, "add", operands, ir.dtype(self));
  if (!(ir.sizes(value) == ir.sizes(self))) {
    diag::invalid_argument("in-place add cannot broadcast its destination");
  }
  graph.mutateTo(self, value);
  return self;
}

} // namespace

void register_mutation_lowerings(LoweringRegistry &registry) {
  registry.registerLowering(ops::aten("copy_"), lower_copy_);
  registry.registerLowering(ops::aten("add_", ""), lower_add_);
}

} // namespace lowir::compiler
