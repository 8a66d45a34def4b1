#include "lowir/compiler/GraphLowering.hpp"
#include "lowir/compiler/ir/render_value.hpp"
#include "lowir/compiler/lowering/LoweringRegistry.hpp"
#include "lowir/compiler/lowering/fallback.hpp"
#include "lowir/diag/invalid_argument.hpp"
#include "lowir/diag/invalid_state.hpp"
#include "lowir/diag/logging.hpp"
#include <exception>
#include <fmt/format.h>

namespace lowir::compiler {

namespace {

bool is_getitem(const OpOverload &op) {
  return op.ns == "operator" && op.name == "getitem";
}

bool unsupported_tensor(const TensorMeta &meta) {
  return is_complex(meta.dtype);
}

bool has_unsupported_tensor(const NodeMeta &meta) {
  switch (meta.tag()) {
  case NodeMetaKind::Tensor:
    return unsupported_tensor(meta.tensor());
  case NodeMetaKind::TensorList:
    for (const TensorMeta &t : meta.tensors()) {
      if (unsupported_tensor(t)) {
        return true;
      }
    }
    return false;
  default:
    return false;
  }
}

// Nodes reading or producing tensors the code generators cannot handle go
// straight to a fallback kernel.
bool fallback_due_to_unsupported_type(const Graph &graph, const Node &node) {
  static const OpOverload viewAsComplex = ops::aten("view_as_complex");
  static const OpOverload liftFreshCopy = ops::aten("lift_fresh_copy");
  if (node.target == viewAsComplex || node.target == liftFreshCopy) {
    return false;
  }
  bool unsupported = false;
  auto check = [&](memory::NodeId producer) {
    unsupported = unsupported || has_unsupported_tensor(graph[producer].meta);
  };
  for (const Argument &arg : node.args) {
    arg.forEachNode(check);
  }
  for (const auto &[key, arg] : node.kwargs) {
    arg.forEachNode(check);
  }
  return unsupported || has_unsupported_tensor(node.meta);
}

std::size_t getitem_index(const Value &index, std::size_t size) {
  if (index.tag() != ValueKind::Int || !index.integer().isConstant()) {
    diag::invalid_argument("getitem expects a static integer index");
  }
  std::int64_t i = index.integer().constant();
  if (i < 0) {
    i += static_cast<std::int64_t>(size);
  }
  if (i < 0 || static_cast<std::size_t>(i) >= size) {
    diag::invalid_argument(
        fmt::format("getitem index {} out of range for {} elements",
                    index.integer().constant(), size));
  }
  return static_cast<std::size_t>(i);
}

} // namespace

LoweringResult GraphLowering::callFunction(const Node &node,
                                           memory::span<const Value> args,
                                           const KwArgs &kwargs) {
  const OpOverload &op = node.target;
  if (is_getitem(op) && args.size() == 2 &&
      args[0].tag() == ValueKind::List) {
    const Value::List &list = args[0].list();
    return list[getitem_index(args[1], list.size())];
  }

  // pattern rewrites bind their replacement directly to the node
  if (node.directLowering) {
    return node.directLowering(*this, node, args, kwargs);
  }

  memory::optional<LoweringFn> fn = m_registry->find(op);
  if (!fn.has_value()) {
    if (LoweringRegistry::onFallbackAllowList(op)) {
      m_registry->makeFallback(op);
    } else if (m_options.implicitFallbacks) {
      LOWIR_INFO("Creating implicit fallback for:\n  {}{}", op.dottedName(),
                 render_args(m_ir, args, kwargs));
      m_registry->makeFallback(op);
    } else if (m_registry->hasDecomposition(op)) {
      return LoweringError{
          MissingWithDecomp{op, render_args(m_ir, args, kwargs)}};
    } else {
      return LoweringError{
          MissingWithoutDecomp{op, render_args(m_ir, args, kwargs)}};
    }
    fn = m_registry->find(op);
    if (!fn.has_value()) {
      diag::invalid_state();
    }
  }

  try {
    LOWIR_DEBUG("  via {}", op);
    return (*fn)(*this, node, args, kwargs);
  } catch (const std::exception &e) {
    return LoweringError{WrappedFailure{
        .op = op,
        .args = render_args(m_ir, args, kwargs),
        .message = e.what(),
        .cause = std::current_exception(),
    }};
  }
}

Value GraphLowering::callNode(const Node &node) {
  memory::vector<Value> args = lowerArguments(node);
  KwArgs kwargs = lowerKwArguments(node);

  Value result;
  if (!is_getitem(node.target) &&
      fallback_due_to_unsupported_type(*m_graph, node)) {
    // not added to the fallback set, other dtypes keep their lowering
    result = make_fallback_kernel(*this, node, node.target, args, kwargs);
  } else if (auto constraint = m_registry->layoutConstraint(node.target)) {
    (*constraint)(*this, node, args, kwargs);
    result = callFunction(node, args, kwargs).unwrap();
  } else if (isSymbolicScalarOp(node.target) &&
             node.meta.tag() == NodeMetaKind::SymInt &&
             (m_reuseShapeEnv || node.meta.symInt().isConstant())) {
    result = node.meta.symInt();
  } else {
    result = callFunction(node, args, kwargs).unwrap();
  }

  result = enforceStrideOrder(node, std::move(result));
  result = applyRealizationPolicy(node, std::move(result));
  tagOrigin(node, result);
  registerUsersOf(result);
  return result;
}

} // namespace lowir::compiler
