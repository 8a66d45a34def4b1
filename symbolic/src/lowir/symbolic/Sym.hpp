#pragma once

#include "lowir/algorithm/hash_combine.hpp"
#include <cassert>
#include <concepts>
#include <cstdint>
#include <fmt/core.h>

namespace lowir {

class ShapeEnv;

// A symbolic integer: either a concrete constant or a handle to an
// expression owned by a ShapeEnv. Handles are only meaningful together with
// the ShapeEnv that produced them.
struct Sym {
  friend ShapeEnv;
  using value_type = std::int64_t;
  using symbol = std::uint64_t;

  bool isSymbolic() const { return !m_isConstant; }
  bool isConstant() const { return m_isConstant; }

  value_type constant() const {
    assert(m_isConstant);
    return m_constant;
  }

  symbol sym() const {
    assert(!m_isConstant);
    return m_sym;
  }

  friend bool operator==(const Sym &lhs, const Sym &rhs) {
    if (lhs.isConstant() && rhs.isConstant()) {
      return lhs.constant() == rhs.constant();
    } else if (lhs.isConstant()) {
      return false;
    } else if (rhs.isConstant()) {
      return false;
    } else {
      assert(lhs.isSymbolic() && rhs.isSymbolic());
      return lhs.sym() == rhs.sym();
    }
  }

  template <typename I>
    requires std::convertible_to<I, value_type>
  static Sym Const(I v) {
    return Sym{static_cast<value_type>(v)};
  }
  static Sym Symbol(symbol sym) { return Sym{sym}; }

  Sym() : m_isConstant(true), m_constant(0) {}

private:
  explicit Sym(value_type v) : m_isConstant(true), m_constant(v) {}
  explicit Sym(symbol sym) : m_isConstant(false), m_sym(sym) {}

  bool m_isConstant;
  union {
    std::uint64_t m_sym;
    std::int64_t m_constant;
  };
};

} // namespace lowir

template <> struct std::hash<lowir::Sym> {
  size_t operator()(const lowir::Sym &s) const noexcept {
    if (s.isConstant()) {
      return lowir::algorithm::hash_combine(size_t{0}, s.constant());
    }
    return lowir::algorithm::hash_combine(size_t{1}, s.sym());
  }
};

template <> struct fmt::formatter<lowir::Sym> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const lowir::Sym &s, FormatContext &ctx) const {
    if (s.isConstant()) {
      return fmt::format_to(ctx.out(), "{}", s.constant());
    }
    return fmt::format_to(ctx.out(), "%{}", s.sym());
  }
};
