#include "lowir/compiler/GraphLowering.hpp"
#include "lowir/compiler/graph/OpOverload.hpp"
#include "lowir/compiler/lowering/LoweringRegistry.hpp"
#include "lowir/compiler/lowering/builtin/arguments.hpp"
#include "lowir/compiler/lowering/builtin/builtin.hpp"
#include "lowir/diag/logging.hpp"

namespace lowir::compiler {

namespace {

bool is_contiguous(const IRGraph &ir, const Layout &layout) {
  const auto expected =
      Layout::contiguousStrides(layout.sizes, ir.shapeEnv());
  for (std::size_t d = 0; d < layout.sizes.size(); ++d) {
    if (layout.sizes[d] == Sym::Const(1)) {
      continue;
    }
    if (!(layout.strides[d] == expected[d])) {
      return false;
    }
  }
  return true;
}

// Replaces a single -1 entry by the extent that preserves numel.
memory::vector<Sym> infer_size(ShapeEnv &env, memory::vector<Sym> sizes,
                               Sym numel) {
  memory::optional<std::size_t> inferred;
  Sym known = Sym::Const(1);
  for (std::size_t d = 0; d < sizes.size(); ++d) {
    if (sizes[d] == Sym::Const(-1)) {
      if (inferred) {
        diag::invalid_argument("only one dimension can be inferred");
      }
      inferred = d;
    } else {
      known = env.mul(known, sizes[d]);
    }
  }
  if (inferred) {
    sizes[*inferred] = env.floordiv(numel, known);
  } else if (env.hint(known) != env.hint(numel)) {
    diag::invalid_argument(fmt::format("shape of {} elements is invalid for "
                                       "input of size {}",
                                       env.to_string(known),
                                       env.to_string(numel)));
  }
  return sizes;
}

Value lower_view(GraphLowering &graph, const Node &node,
                 memory::span<const Value> args, const KwArgs &) {
  IRGraph &ir = graph.ir();
  ShapeEnv &env = ir.shapeEnv();
  IRNodeId self = tensor_arg(args, 0);
  if (args.size() < 2) {
    diag::invalid_argument("view expects a size argument");
  }
  auto sizes = infer_size(env, ints_value(args[1]), ir.numel(self));

  ir.freezeLayout(self);
  const Layout &layout = ir.layout(self);
  Sym offset = layout.offset;
  if (!is_contiguous(ir, layout)) {
    LOWIR_DEBUG("{}: copying non-contiguous input before reshaping",
                node.name);
    const auto inSizes = ir.sizes(self);
    self = ir.copyInto(self,
                       Layout::fixed(ir.device(self), ir.dtype(self), inSizes,
                                     Layout::contiguousStrides(inSizes, env)));
    offset = Sym::Const(0);
  }
  auto strides = Layout::contiguousStrides(sizes, env);
  return ir.reinterpret(self, std::move(sizes), std::move(strides), offset);
}

Value lower_permute(GraphLowering &graph, const Node &,
                    memory::span<const Value> args, const KwArgs &) {
  IRGraph &ir = graph.ir();
  const IRNodeId self = tensor_arg(args, 0);
  if (args.size() < 2) {
    diag::invalid_argument("permute expects a dims argument");
  }
  const auto dims = const_ints_value(args[1]);
  ir.freezeLayout(self);
  const Layout &layout = ir.layout(self);
  if (dims.size() != layout.sizes.size()) {
    diag::invalid_argument(fmt::format(
        "permute of rank {} applied to a rank {} tensor", dims.size(),
        layout.sizes.size()));
  }
  memory::vector<Sym> sizes;
  memory::vector<Sym> strides;
  memory::vector<bool> seen(dims.size(), false);
  for (std::int64_t d : dims) {
    const std::size_t dim = wrap_dim(d, dims.size());
    if (seen[dim]) {
      diag::invalid_argument(fmt::format("repeated dim {} in permute", dim));
    }
    seen[dim] = true;
    sizes.push_back(layout.sizes[dim]);
    strides.push_back(layout.strides[dim]);
  }
  const Sym offset = layout.offset;
  return ir.reinterpret(self, std::move(sizes), std::move(strides), offset);
}

Value lower_expand(GraphLowering &graph, const Node &,
                   memory::span<const Value> args, const KwArgs &) {
  IRGraph &ir = graph.ir();
  const IRNodeId self = tensor_arg(args, 0);
  if (args.size() < 2) {
    diag::invalid_argument("expand expects a size argument");
  }
  const auto target = ints_value(args[1]);
  ir.freezeLayout(self);
  const Layout &layout = ir.layout(self);
  if (target.size() < layout.sizes.size()) {
    diag::invalid_argument("expand cannot reduce the rank of a tensor");
  }
  const std::size_t lead = target.size() - layout.sizes.size();
  memory::vector<Sym> sizes(target.size());
  memory::vector<Sym> strides(target.size(), Sym::Const(0));
  for (std::size_t d = 0; d < target.size(); ++d) {
    if (d < lead) {
      sizes[d] = target[d];
      continue;
    }
    const Sym current = layout.sizes[d - lead];
    const Sym requested = target[d];
    if (requested == Sym::Const(-1) || requested == current) {
      sizes[d] = current;
      strides[d] = layout.strides[d - lead];
    } else if (current == Sym::Const(1)) {
      sizes[d] = requested;
    } else {
      diag::invalid_argument(fmt::format(
          "expanded size {} must match the existing size {} at dimension {}",
          ir.shapeEnv().to_string(requested),
          ir.shapeEnv().to_string(current), d));
    }
  }
  const Sym offset = layout.offset;
  return ir.reinterpret(self, std::move(sizes), std::move(strides), offset);
}

Value lower_as_strided(GraphLowering &graph, const Node &,
                       memory::span<const Value> args, const KwArgs &kwargs) {
  IRGraph &ir = graph.ir();
  const IRNodeId self = tensor_arg(args, 0);
  if (args.size() < 3) {
    diag::invalid_argument("as_strided expects size and stride arguments");
  }
  auto sizes = ints_value(args[1]);
  auto strides = ints_value(args[2]);
  if (sizes.size() != strides.size()) {
    diag::invalid_argument("as_strided size and stride differ in length");
  }
  ir.freezeLayout(self);
  Sym offset = ir.layout(self).offset;
  const Value *storageOffset = arg_or_kwarg(args, kwargs, 3, "storage_offset");
  if (storageOffset != nullptr && !storageOffset->isNone()) {
    offset = int_value(*storageOffset);
  }
  return ir.reinterpret(self, std::move(sizes), std::move(strides), offset);
}

} // namespace

void register_view_lowerings(LoweringRegistry &registry) {
  registry.registerLowering(ops::aten("view"), lower_view);
  registry.registerLowering(ops::aten("reshape"), lower_view);
  registry.registerLowering(ops::aten("_unsafe_view"), lower_view);
  registry.registerLowering(ops::aten("permute"), lower_permute);
  registry.registerLowering(ops::aten("expand"), lower_expand);
  registry.registerLowering(ops::aten("as_strided"), lower_as_strided);
}

} // namespace lowir::compiler
