#include "lowir/diag/invalid_argument.hpp"
#include "lowir/symbolic/ShapeEnv.hpp"
#include <fmt/format.h>
#include <utility>

namespace lowir {

namespace {

// Canonical operand order for commutative operators: symbols before
// constants, lower symbol ids first.
void canonicalize_commutative(Sym &lhs, Sym &rhs) {
  if (lhs.isConstant() && rhs.isSymbolic()) {
    std::swap(lhs, rhs);
  } else if (lhs.isSymbolic() && rhs.isSymbolic() && rhs.sym() < lhs.sym()) {
    std::swap(lhs, rhs);
  }
}

Sym::value_type floor_div(Sym::value_type l, Sym::value_type r) {
  Sym::value_type q = l / r;
  if ((l % r != 0) && ((l < 0) != (r < 0))) {
    --q;
  }
  return q;
}

} // namespace

Sym ShapeEnv::add_impl(Sym lhs, Sym rhs) {
  if (lhs.isConstant() && rhs.isConstant()) {
    return Sym::Const(lhs.constant() + rhs.constant());
  }
  canonicalize_commutative(lhs, rhs);
  if (rhs.isConstant()) {
    if (rhs.constant() == 0) {
      return lhs;
    }
    // (x + c0) + c1 => x + (c0 + c1)
    const Expr &inner = m_expressions[lhs.sym()];
    if (inner.kind == ExprKind::Add && inner.rhs.isConstant()) {
      return add_impl(inner.lhs, Sym::Const(inner.rhs.constant() +
                                            rhs.constant()));
    }
  }
  return intern(ExprKind::Add, lhs, rhs);
}

Sym ShapeEnv::sub_impl(Sym lhs, Sym rhs) {
  if (lhs.isConstant() && rhs.isConstant()) {
    return Sym::Const(lhs.constant() - rhs.constant());
  }
  if (lhs == rhs) {
    return Sym::Const(0);
  }
  if (rhs.isConstant()) {
    return add_impl(lhs, Sym::Const(-rhs.constant()));
  }
  return intern(ExprKind::Sub, lhs, rhs);
}

Sym ShapeEnv::mul_impl(Sym lhs, Sym rhs) {
  if (lhs.isConstant() && rhs.isConstant()) {
    return Sym::Const(lhs.constant() * rhs.constant());
  }
  canonicalize_commutative(lhs, rhs);
  if (rhs.isConstant()) {
    if (rhs.constant() == 0) {
      return Sym::Const(0);
    }
    if (rhs.constant() == 1) {
      return lhs;
    }
    // (x * c0) * c1 => x * (c0 * c1)
    const Expr &inner = m_expressions[lhs.sym()];
    if (inner.kind == ExprKind::Mul && inner.rhs.isConstant()) {
      return mul_impl(inner.lhs, Sym::Const(inner.rhs.constant() *
                                            rhs.constant()));
    }
  }
  return intern(ExprKind::Mul, lhs, rhs);
}

Sym ShapeEnv::floordiv_impl(Sym lhs, Sym rhs) {
  if (rhs.isConstant() && rhs.constant() == 0) {
    diag::invalid_argument("symbolic floor division by zero");
  }
  if (lhs.isConstant() && rhs.isConstant()) {
    return Sym::Const(floor_div(lhs.constant(), rhs.constant()));
  }
  if (rhs.isConstant() && rhs.constant() == 1) {
    return lhs;
  }
  if (lhs == rhs) {
    return Sym::Const(1);
  }
  if (lhs.isSymbolic() && rhs.isConstant()) {
    // (x * c) // c => x
    const Expr &inner = m_expressions[lhs.sym()];
    if (inner.kind == ExprKind::Mul && inner.rhs == rhs) {
      return inner.lhs;
    }
  }
  return intern(ExprKind::FloorDiv, lhs, rhs);
}

Sym ShapeEnv::add(Sym lhs, Sym rhs) {
  std::lock_guard lock{m_mutex};
  return add_impl(lhs, rhs);
}

Sym ShapeEnv::sub(Sym lhs, Sym rhs) {
  std::lock_guard lock{m_mutex};
  return sub_impl(lhs, rhs);
}

Sym ShapeEnv::mul(Sym lhs, Sym rhs) {
  std::lock_guard lock{m_mutex};
  return mul_impl(lhs, rhs);
}

Sym ShapeEnv::floordiv(Sym lhs, Sym rhs) {
  std::lock_guard lock{m_mutex};
  return floordiv_impl(lhs, rhs);
}

Sym ShapeEnv::pool(Sym extent, value_type kernel, value_type padding,
                   value_type stride, value_type dilation) {
  if (stride <= 0 || kernel <= 0 || dilation <= 0) {
    diag::invalid_argument(fmt::format(
        "invalid window: kernel={}, stride={}, dilation={}", kernel, stride,
        dilation));
  }
  std::lock_guard lock{m_mutex};
  // floor((extent + 2p - d*(k-1) - 1) / s) + 1
  Sym numerator = add_impl(
      extent, Sym::Const(2 * padding - dilation * (kernel - 1) - 1));
  return add_impl(floordiv_impl(numerator, Sym::Const(stride)),
                  Sym::Const(1));
}

Sym ShapeEnv::product(memory::span<const Sym> factors) {
  std::lock_guard lock{m_mutex};
  Sym acc = Sym::Const(1);
  for (const Sym &f : factors) {
    acc = mul_impl(acc, f);
  }
  return acc;
}

} // namespace lowir
