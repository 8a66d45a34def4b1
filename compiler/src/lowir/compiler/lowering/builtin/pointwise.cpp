#include "lowir/compiler/lowering/builtin/pointwise.hpp"
#include "lowir/compiler/GraphLowering.hpp"
#include "lowir/compiler/graph/OpOverload.hpp"
#include "lowir/compiler/lowering/LoweringRegistry.hpp"
#include "lowir/compiler/lowering/builtin/arguments.hpp"
#include "lowir/compiler/lowering/builtin/builtin.hpp"
#include "lowir/diag/invalid_argument.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace lowir::compiler {

IRNodeId load_operand(IRGraph &ir, IRNodeId tensor) {
  if (!ir.isView(tensor) &&
      ir[ir.dataOf(tensor)].tag() == IRNodeKind::Reduction) {
    ir.realize(tensor);
  }
  return ir.operand(tensor);
}

memory::vector<Sym> broadcast_shapes(const ShapeEnv &env,
                                     memory::span<const Sym> lhs,
                                     memory::span<const Sym> rhs) {
  const std::size_t rank = std::max(lhs.size(), rhs.size());
  memory::vector<Sym> out(rank);
  for (std::size_t i = 0; i < rank; ++i) {
    const bool hasL = i < lhs.size();
    const bool hasR = i < rhs.size();
    const Sym a = hasL ? lhs[lhs.size() - 1 - i] : Sym::Const(1);
    const Sym b = hasR ? rhs[rhs.size() - 1 - i] : Sym::Const(1);
    Sym s;
    if (a == b) {
      s = a;
    } else if (a == Sym::Const(1)) {
      s = b;
    } else if (b == Sym::Const(1)) {
      s = a;
    } else if (env.hint(a) == env.hint(b)) {
      // same example value under different symbols, keep the first
      s = a;
    } else {
      diag::invalid_argument(fmt::format(
          "shapes cannot be broadcast: {} vs {} in dimension {}",
          env.to_string(a), env.to_string(b), rank - 1 - i));
    }
    out[rank - 1 - i] = s;
  }
  return out;
}

TensorDataType promote_types(const IRGraph &ir,
                             memory::span<const Value> operands) {
  memory::optional<TensorDataType> result;
  bool floatScalar = false;
  for (const Value &v : operands) {
    if (v.isTensor()) {
      const TensorDataType dt = ir.dtype(v.tensor());
      if (!result || static_cast<int>(dt) > static_cast<int>(*result)) {
        result = dt;
      }
    } else if (v.tag() == ValueKind::Float) {
      floatScalar = true;
    }
  }
  if (!result) {
    diag::invalid_argument("elementwise operation without tensor operands");
  }
  if (floatScalar && !is_floating_point(*result) && !is_complex(*result)) {
    return TensorDataType::Float32;
  }
  return *result;
}

IRNodeId make_pointwise(GraphLowering &graph, memory::string fn,
                        memory::span<const Value> operands,
                        memory::optional<TensorDataType> dtype) {
  IRGraph &ir = graph.ir();
  memory::optional<Device> device;
  memory::vector<Sym> ranges;
  memory::vector<IRNodeId> inputs;
  memory::vector<memory::string> scalars;
  for (const Value &v : operands) {
    switch (v.tag()) {
    case ValueKind::Tensor: {
      const IRNodeId t = v.tensor();
      if (!device) {
        device = ir.device(t);
      }
      const auto sizes = ir.sizes(t);
      ranges = broadcast_shapes(ir.shapeEnv(), ranges, sizes);
      inputs.push_back(load_operand(ir, t));
      break;
    }
    case ValueKind::Int:
      scalars.push_back(ir.shapeEnv().to_string(v.integer()));
      break;
    case ValueKind::Float:
      scalars.push_back(fmt::format("{}", v.floating()));
      break;
    case ValueKind::Bool:
      scalars.push_back(v.boolean() ? "True" : "False");
      break;
    default:
      diag::invalid_argument(
          fmt::format("unsupported operand for elementwise {}", fn));
    }
  }
  if (!device) {
    diag::invalid_argument(
        fmt::format("elementwise {} without tensor operands", fn));
  }
  return ir.box(Pointwise{
      .device = *device,
      .dtype = dtype.value_or(promote_types(ir, operands)),
      .ranges = std::move(ranges),
      .fn = std::move(fn),
      .inputs = std::move(inputs),
      .scalars = std::move(scalars),
  });
}

// other * alpha, folded when both are literals.
Value scale_by_alpha(GraphLowering &graph, const Value &other,
                     const Value &alpha) {
  if (alpha.tag() == ValueKind::Int && alpha.integer() == Sym::Const(1)) {
    return other;
  }
  if (other.isTensor()) {
    const Value operands[] = {other, alpha};
    return make_pointwise(graph, "mul", operands);
  }
  if (other.tag() == ValueKind::Int && alpha.tag() == ValueKind::Int) {
    return graph.shapeEnv().mul(other.integer(), alpha.integer());
  }
  auto as_double = [&](const Value &v) {
    if (v.tag() == ValueKind::Float) {
      return v.floating();
    }
    return static_cast<double>(const_int_value(v));
  };
  return Value::Float(as_double(other) * as_double(alpha));
}

namespace {

LoweringFn binary(memory::string fn, bool trueDivide = false) {
  return [fn, trueDivide](GraphLowering &graph, const Node &,
                          memory::span<const Value> args,
                          const KwArgs &kwargs) -> Value {
    if (args.size() < 2) {
      diag::invalid_argument(fmt::format("{} expects two operands", fn));
    }
    Value other = args[1];
    if (trueDivide) {
      // div.Tensor_mode
      const Value *mode = arg_or_kwarg(args, kwargs, 2, "rounding_mode");
      if (mode != nullptr && mode->tag() == ValueKind::String) {
        const Value operands[] = {args[0], other};
        return make_pointwise(graph, fmt::format("{}div", mode->string()),
                              operands);
      }
    } else if (const Value *alpha = arg_or_kwarg(args, kwargs, 2, "alpha")) {
      other = scale_by_alpha(graph, other, *alpha);
    }
    const Value operands[] = {args[0], other};
    memory::optional<TensorDataType> dtype;
    if (trueDivide) {
      const TensorDataType promoted = promote_types(graph.ir(), operands);
      if (!is_floating_point(promoted) && !is_complex(promoted)) {
        dtype = TensorDataType::Float32;
      }
    }
    return make_pointwise(graph, fn, operands, dtype);
  };
}

// Integer inputs of transcendental functions compute in float.
LoweringFn unary(memory::string fn, bool intToFloat = false) {
  return [fn, intToFloat](GraphLowering &graph, const Node &,
                          memory::span<const Value> args,
                          const KwArgs &) -> Value {
    const IRNodeId self = tensor_arg(args, 0);
    memory::optional<TensorDataType> dtype;
    const TensorDataType dt = graph.ir().dtype(self);
    if (intToFloat && !is_floating_point(dt) && !is_complex(dt)) {
      dtype = TensorDataType::Float32;
    }
    return make_pointwise(graph, fn, args.subspan(0, 1), dtype);
  };
}

Value lower_copy(GraphLowering &graph, const Node &,
                 memory::span<const Value> args, const KwArgs &) {
  IRGraph &ir = graph.ir();
  const IRNodeId self = tensor_arg(args, 0);
  const IRNodeId src = tensor_arg(args, 1);
  const auto sizes = ir.sizes(self);
  broadcast_shapes(ir.shapeEnv(), sizes, ir.sizes(src));
  return ir.box(Pointwise{
      .device = ir.device(self),
      .dtype = ir.dtype(self),
      .ranges = sizes,
      .fn = "copy",
      .inputs = {load_operand(ir, src)},
      .scalars = {},
  });
}

} // namespace

void register_pointwise_lowerings(LoweringRegistry &registry) {
  registry.registerLowering(ops::aten("add", ""), binary("add"));
  registry.registerLowering(ops::aten("sub", ""), binary("sub"));
  registry.registerLowering(ops::aten("mul", ""), binary("mul"));
  registry.registerLowering(ops::aten("div", ""), binary("truediv", true));

  registry.registerLowering(ops::aten("relu"), unary("relu"));
  registry.registerLowering(ops::aten("neg"), unary("neg"));
  registry.registerLowering(ops::aten("exp"), unary("exp", true));
  registry.registerLowering(ops::aten("sigmoid"), unary("sigmoid", true));
  registry.registerLowering(ops::aten("tanh"), unary("tanh", true));
  registry.registerLowering(ops::aten("clone"), unary("clone"));
  registry.registerLowering(ops::aten("copy"), lower_copy);
}

} // namespace lowir::compiler
