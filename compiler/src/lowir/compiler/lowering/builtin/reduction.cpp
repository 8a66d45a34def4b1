#include "lowir/compiler/GraphLowering.hpp"
#include "lowir/compiler/graph/OpOverload.hpp"
#include "lowir/compiler/lowering/LoweringRegistry.hpp"
#include "lowir/compiler/lowering/builtin/arguments.hpp"
#include "lowir/compiler/lowering/builtin/builtin.hpp"
#include "lowir/compiler/lowering/builtin/pointwise.hpp"
#include "lowir/memory/container/hashset.hpp"

namespace lowir::compiler {

namespace {

enum class ReductionDtype {
  // sum: integral inputs accumulate in int64
  Accumulate,
  Keep,
  // mean: only defined for floating point
  Floating,
};

LoweringFn reduction(memory::string type, ReductionDtype policy) {
  return [type, policy](GraphLowering &graph, const Node &,
                        memory::span<const Value> args,
                        const KwArgs &kwargs) -> Value {
    IRGraph &ir = graph.ir();
    const IRNodeId self = tensor_arg(args, 0);
    const auto sizes = ir.sizes(self);

    memory::hash_set<std::size_t> reduced;
    const Value *dimArg = arg_or_kwarg(args, kwargs, 1, "dim");
    if (dimArg != nullptr && !dimArg->isNone()) {
      for (std::int64_t d : const_ints_value(*dimArg)) {
        reduced.insert(wrap_dim(d, sizes.size()));
      }
    }
    // an empty dim list reduces every dimension
    const bool all = reduced.empty();

    bool keepdim = false;
    if (const Value *k = arg_or_kwarg(args, kwargs, 2, "keepdim")) {
      keepdim = bool_value(*k);
    }

    memory::vector<Sym> ranges;
    memory::vector<Sym> reductionRanges;
    for (std::size_t d = 0; d < sizes.size(); ++d) {
      if (all || reduced.contains(d)) {
        reductionRanges.push_back(sizes[d]);
        if (keepdim) {
          ranges.push_back(Sym::Const(1));
        }
      } else {
        ranges.push_back(sizes[d]);
      }
    }

    TensorDataType dtype = ir.dtype(self);
    const Value *dtypeArg = find_kwarg(kwargs, "dtype");
    if (policy == ReductionDtype::Accumulate && !is_floating_point(dtype) &&
        !is_complex(dtype)) {
      dtype = TensorDataType::Int64;
    }
    if (policy == ReductionDtype::Floating && !is_floating_point(dtype) &&
        !is_complex(dtype) && (dtypeArg == nullptr || dtypeArg->isNone())) {
      diag::invalid_argument(
          fmt::format("{} is only defined for floating point inputs, got {}",
                      type, dtype));
    }

    return ir.box(Reduction{
        .device = ir.device(self),
        .dtype = dtype,
        .ranges = std::move(ranges),
        .reductionRanges = std::move(reductionRanges),
        .reductionType = type,
        .inputs = {load_operand(ir, self)},
    });
  };
}

} // namespace

void register_reduction_lowerings(LoweringRegistry &registry) {
  registry.registerLowering(ops::aten("sum", "dim_IntList"),
                            reduction("sum", ReductionDtype::Accumulate));
  registry.registerLowering(ops::aten("amax"),
                            reduction("max", ReductionDtype::Keep));
  registry.registerLowering(ops::aten("mean", "dim"),
                            reduction("mean", ReductionDtype::Floating));
}

} // namespace lowir::compiler
