#include "lowir/symbolic/ShapeEnv.hpp"
#include "lowir/diag/invalid_argument.hpp"
#include "lowir/diag/unreachable.hpp"
#include <fmt/format.h>

namespace lowir {

Sym ShapeEnv::createSymbol(value_type hint, memory::string_view source) {
  if (hint < 0) {
    diag::invalid_argument(
        fmt::format("cannot create a symbol for negative value {}", hint));
  }
  if (hint == 0 || hint == 1) {
    return Sym::Const(hint);
  }
  std::lock_guard lock{m_mutex};
  if (m_duckShape) {
    auto it = m_valueToSymbol.find(hint);
    if (it != m_valueToSymbol.end()) {
      return it->second;
    }
  }
  Sym sym = Sym::Symbol(m_expressions.size());
  m_expressions.push_back(Expr{
      .kind = ExprKind::Var,
      .lhs = Sym::Const(0),
      .rhs = Sym::Const(0),
      .hint = hint,
      .name = fmt::format("s{}", m_leafCount++),
      .source = memory::string(source),
  });
  m_valueToSymbol.emplace(hint, sym);
  return sym;
}

Sym ShapeEnv::intern(ExprKind kind, Sym lhs, Sym rhs) {
  ExprKey key{kind, lhs, rhs};
  auto it = m_exprCache.find(key);
  if (it != m_exprCache.end()) {
    return it->second;
  }
  const value_type l = hint_impl(lhs);
  const value_type r = hint_impl(rhs);
  value_type hint;
  switch (kind) {
  case ExprKind::Add:
    hint = l + r;
    break;
  case ExprKind::Sub:
    hint = l - r;
    break;
  case ExprKind::Mul:
    hint = l * r;
    break;
  case ExprKind::FloorDiv: {
    if (r == 0) {
      diag::invalid_argument(
          fmt::format("floor division by %{} whose hint is zero", rhs.sym()));
    }
    hint = l / r;
    if ((l % r != 0) && ((l < 0) != (r < 0))) {
      --hint;
    }
    break;
  }
  case ExprKind::Var:
  default:
    diag::unreachable();
  }
  Sym sym = Sym::Symbol(m_expressions.size());
  m_expressions.push_back(Expr{
      .kind = kind,
      .lhs = lhs,
      .rhs = rhs,
      .hint = hint,
      .name = {},
      .source = {},
  });
  m_exprCache.emplace(key, sym);
  return sym;
}

ShapeEnv::value_type ShapeEnv::hint_impl(Sym sym) const {
  if (sym.isConstant()) {
    return sym.constant();
  }
  if (sym.sym() >= m_expressions.size()) {
    diag::invalid_argument(
        fmt::format("symbol %{} does not belong to this ShapeEnv", sym.sym()));
  }
  return m_expressions[sym.sym()].hint;
}

ShapeEnv::value_type ShapeEnv::hint(Sym sym) const {
  std::lock_guard lock{m_mutex};
  return hint_impl(sym);
}

memory::vector<ShapeEnv::value_type>
ShapeEnv::hints(memory::span<const Sym> syms) const {
  std::lock_guard lock{m_mutex};
  memory::vector<value_type> out;
  out.reserve(syms.size());
  for (const Sym &s : syms) {
    out.push_back(hint_impl(s));
  }
  return out;
}

bool ShapeEnv::isLeaf(Sym sym) const {
  if (sym.isConstant()) {
    return false;
  }
  std::lock_guard lock{m_mutex};
  return sym.sym() < m_expressions.size() &&
         m_expressions[sym.sym()].kind == ExprKind::Var;
}

memory::string ShapeEnv::source(Sym sym) const {
  if (sym.isConstant()) {
    return {};
  }
  std::lock_guard lock{m_mutex};
  if (sym.sym() >= m_expressions.size()) {
    return {};
  }
  return m_expressions[sym.sym()].source;
}

std::size_t ShapeEnv::symbolCount() const {
  std::lock_guard lock{m_mutex};
  return m_leafCount;
}

memory::string ShapeEnv::to_string(Sym sym) const {
  std::lock_guard lock{m_mutex};
  memory::string out;
  to_string_impl(sym, out, false);
  return out;
}

void ShapeEnv::to_string_impl(Sym sym, memory::string &out,
                              bool parenthesize) const {
  if (sym.isConstant()) {
    out += fmt::format("{}", sym.constant());
    return;
  }
  const Expr &expr = m_expressions[sym.sym()];
  if (expr.kind == ExprKind::Var) {
    out += expr.name;
    return;
  }
  if (parenthesize) {
    out += '(';
  }
  switch (expr.kind) {
  case ExprKind::Add:
    to_string_impl(expr.lhs, out, false);
    out += " + ";
    to_string_impl(expr.rhs, out, false);
    break;
  case ExprKind::Sub:
    to_string_impl(expr.lhs, out, false);
    out += " - ";
    to_string_impl(expr.rhs, out, true);
    break;
  case ExprKind::Mul:
    to_string_impl(expr.lhs, out, true);
    out += "*";
    to_string_impl(expr.rhs, out, true);
    break;
  case ExprKind::FloorDiv:
    to_string_impl(expr.lhs, out, true);
    out += "//";
    to_string_impl(expr.rhs, out, true);
    break;
  case ExprKind::Var:
    diag::unreachable();
  }
  if (parenthesize) {
    out += ')';
  }
}

} // namespace lowir
