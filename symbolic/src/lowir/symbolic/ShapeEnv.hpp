#pragma once

#include "lowir/memory/container/hashmap.hpp"
#include "lowir/memory/container/span.hpp"
#include "lowir/memory/container/string.hpp"
#include "lowir/memory/container/string_view.hpp"
#include "lowir/memory/container/vector.hpp"
#include "lowir/symbolic/Sym.hpp"
#include <mutex>

namespace lowir {

// Owns symbolic shape variables and the expressions built from them.
//
// Leaf symbols are created from concrete example values. With duck shaping
// enabled, every request for an already seen example value returns the symbol
// that was allocated first for it. The values 0 and 1 are never symbolic.
//
// Expressions are hash-consed: structurally equal expressions are the same
// Sym. All members are internally synchronized, so several lowerings may share
// one ShapeEnv.
class ShapeEnv {
public:
  using value_type = Sym::value_type;
  using symbol = Sym::symbol;

  explicit ShapeEnv(bool duckShape = true) : m_duckShape(duckShape) {}

  ShapeEnv(const ShapeEnv &) = delete;
  ShapeEnv &operator=(const ShapeEnv &) = delete;

  Sym createSymbol(value_type hint, memory::string_view source);

  Sym add(Sym lhs, Sym rhs);
  Sym sub(Sym lhs, Sym rhs);
  Sym mul(Sym lhs, Sym rhs);
  Sym floordiv(Sym lhs, Sym rhs);

  // Output extent of a convolution or pooling window along one axis.
  Sym pool(Sym extent, value_type kernel, value_type padding,
           value_type stride, value_type dilation = 1);

  Sym product(memory::span<const Sym> factors);

  value_type hint(Sym sym) const;
  memory::vector<value_type> hints(memory::span<const Sym> syms) const;

  memory::string to_string(Sym sym) const;

  // Provenance of a leaf symbol; empty for constants and compound expressions.
  memory::string source(Sym sym) const;

  bool isLeaf(Sym sym) const;

  std::size_t symbolCount() const;

  bool duckShape() const { return m_duckShape; }

private:
  enum class ExprKind {
    Var,
    Add,
    Sub,
    Mul,
    FloorDiv,
  };

  struct Expr {
    ExprKind kind;
    Sym lhs;
    Sym rhs;
    value_type hint;
    memory::string name;
    memory::string source;
  };

  struct ExprKey {
    ExprKind kind;
    Sym lhs;
    Sym rhs;
    friend bool operator==(const ExprKey &, const ExprKey &) = default;
  };

  struct ExprKeyHash {
    size_t operator()(const ExprKey &key) const noexcept {
      size_t hash = std::hash<int>{}(static_cast<int>(key.kind));
      hash = algorithm::hash_combine(hash, key.lhs);
      return algorithm::hash_combine(hash, key.rhs);
    }
  };

  value_type hint_impl(Sym sym) const;
  Sym intern(ExprKind kind, Sym lhs, Sym rhs);
  Sym add_impl(Sym lhs, Sym rhs);
  Sym sub_impl(Sym lhs, Sym rhs);
  Sym mul_impl(Sym lhs, Sym rhs);
  Sym floordiv_impl(Sym lhs, Sym rhs);
  void to_string_impl(Sym sym, memory::string &out, bool parenthesize) const;

  bool m_duckShape;
  mutable std::mutex m_mutex;
  memory::vector<Expr> m_expressions;
  memory::hash_map<value_type, Sym> m_valueToSymbol;
  memory::hash_map<ExprKey, Sym, ExprKeyHash> m_exprCache;
  std::size_t m_leafCount = 0;
};

} // namespace lowir
