#include "lowir/compiler/GraphLowering.hpp"
#include "lowir/compiler/graph/OpOverload.hpp"
#include "lowir/compiler/lowering/LoweringRegistry.hpp"
#include "lowir/compiler/lowering/builtin/arguments.hpp"
#include "lowir/compiler/lowering/builtin/builtin.hpp"
#include <cmath>

namespace lowir::compiler {

namespace {

Value lower_sym_size(GraphLowering &graph, const Node &,
                     memory::span<const Value> args, const KwArgs &) {
  const IRNodeId self = tensor_arg(args, 0);
  const auto sizes = graph.ir().sizes(self);
  if (args.size() < 2) {
    diag::invalid_argument("sym_size expects a dim argument");
  }
  return sizes[wrap_dim(const_int_value(args[1]), sizes.size())];
}

Value lower_sym_stride(GraphLowering &graph, const Node &,
                       memory::span<const Value> args, const KwArgs &) {
  IRGraph &ir = graph.ir();
  const IRNodeId self = tensor_arg(args, 0);
  if (args.size() < 2) {
    diag::invalid_argument("sym_stride expects a dim argument");
  }
  ir.freezeLayout(self);
  const auto &strides = ir.layout(self).strides;
  return strides[wrap_dim(const_int_value(args[1]), strides.size())];
}

Value lower_sym_numel(GraphLowering &graph, const Node &,
                      memory::span<const Value> args, const KwArgs &) {
  return graph.ir().numel(tensor_arg(args, 0));
}

enum class ScalarOp {
  Add,
  Sub,
  Mul,
  FloorDiv,
};

LoweringFn scalar_op(ScalarOp op) {
  return [op](GraphLowering &graph, const Node &,
              memory::span<const Value> args, const KwArgs &) -> Value {
    if (args.size() != 2) {
      diag::invalid_argument("scalar operators expect two operands");
    }
    const Value &lhs = args[0];
    const Value &rhs = args[1];
    if (lhs.tag() == ValueKind::Int && rhs.tag() == ValueKind::Int) {
      ShapeEnv &env = graph.shapeEnv();
      switch (op) {
      case ScalarOp::Add:
        return env.add(lhs.integer(), rhs.integer());
      case ScalarOp::Sub:
        return env.sub(lhs.integer(), rhs.integer());
      case ScalarOp::Mul:
        return env.mul(lhs.integer(), rhs.integer());
      case ScalarOp::FloorDiv:
        return env.floordiv(lhs.integer(), rhs.integer());
      }
    }
    auto as_double = [](const Value &v) {
      if (v.tag() == ValueKind::Float) {
        return v.floating();
      }
      return static_cast<double>(const_int_value(v));
    };
    const double a = as_double(lhs);
    const double b = as_double(rhs);
    switch (op) {
    case ScalarOp::Add:
      return Value::Float(a + b);
    case ScalarOp::Sub:
      return Value::Float(a - b);
    case ScalarOp::Mul:
      return Value::Float(a * b);
    case ScalarOp::FloorDiv:
      if (b == 0.0) {
        diag::invalid_argument("float floor division by zero");
      }
      return Value::Float(std::floor(a / b));
    }
    diag::unreachable();
  };
}

OpOverload operator_overload(memory::string_view name) {
  return OpOverload{"operator", memory::string(name), ""};
}

} // namespace

void register_symbolic_lowerings(LoweringRegistry &registry) {
  registry.registerLowering(ops::aten("sym_size", "int"), lower_sym_size);
  registry.registerLowering(ops::aten("sym_stride", "int"), lower_sym_stride);
  registry.registerLowering(ops::aten("sym_numel"), lower_sym_numel);
  registry.registerLowering(operator_overload("add"), scalar_op(ScalarOp::Add));
  registry.registerLowering(operator_overload("sub"), scalar_op(ScalarOp::Sub));
  registry.registerLowering(operator_overload("mul"), scalar_op(ScalarOp::Mul));
  registry.registerLowering(operator_overload("floordiv"),
                            scalar_op(ScalarOp::FloorDiv));
}

} // namespace lowir::compiler
