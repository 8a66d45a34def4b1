#pragma once

#include "lowir/compiler/ir/IRNodeId.hpp"
#include "lowir/memory/container/string.hpp"
#include "lowir/memory/container/string_view.hpp"
#include "lowir/memory/container/vector.hpp"
#include "lowir/symbolic/Sym.hpp"
#include <cassert>
#include <utility>
#include <variant>

namespace lowir::compiler {

enum class ValueKind {
  None,
  Tensor,
  Int,
  Float,
  Bool,
  String,
  List,
};

// Result of lowering a graph node: a tensor handle into the IRGraph, a
// symbolic integer, a literal, or a list of those.
class Value {
public:
  using List = memory::vector<Value>;

  Value() = default;
  Value(IRNodeId tensor) : m_var(tensor) {}
  Value(Sym sym) : m_var(sym) {}
  Value(List list) : m_var(std::move(list)) {}

  static Value Float(double v) { return Value{Tag{}, v}; }
  static Value Bool(bool v) { return Value{Tag{}, v}; }
  static Value String(memory::string v) { return Value{Tag{}, std::move(v)}; }

  ValueKind tag() const {
    switch (m_var.index()) {
    case 0:
      return ValueKind::None;
    case 1:
      return ValueKind::Tensor;
    case 2:
      return ValueKind::Int;
    case 3:
      return ValueKind::Float;
    case 4:
      return ValueKind::Bool;
    case 5:
      return ValueKind::String;
    default:
      return ValueKind::List;
    }
  }

  bool isNone() const { return tag() == ValueKind::None; }
  bool isTensor() const { return tag() == ValueKind::Tensor; }

  IRNodeId tensor() const {
    assert(std::holds_alternative<IRNodeId>(m_var));
    return std::get<IRNodeId>(m_var);
  }

  Sym integer() const {
    assert(std::holds_alternative<Sym>(m_var));
    return std::get<Sym>(m_var);
  }

  double floating() const {
    assert(std::holds_alternative<double>(m_var));
    return std::get<double>(m_var);
  }

  bool boolean() const {
    assert(std::holds_alternative<bool>(m_var));
    return std::get<bool>(m_var);
  }

  const memory::string &string() const {
    assert(std::holds_alternative<memory::string>(m_var));
    return std::get<memory::string>(m_var);
  }

  const List &list() const {
    assert(std::holds_alternative<List>(m_var));
    return std::get<List>(m_var);
  }

  template <typename F> void forEachTensor(F &&f) const {
    if (isTensor()) {
      f(tensor());
    } else if (tag() == ValueKind::List) {
      for (const auto &v : list()) {
        v.forEachTensor(f);
      }
    }
  }

  friend bool operator==(const Value &lhs, const Value &rhs) {
    return lhs.m_var == rhs.m_var;
  }

private:
  struct Tag {};
  template <typename T> Value(Tag, T v) : m_var(std::move(v)) {}

  std::variant<std::monostate, IRNodeId, Sym, double, bool, memory::string,
               List>
      m_var;
};

using KwArgs = memory::vector<std::pair<memory::string, Value>>;

inline const Value *find_kwarg(const KwArgs &kwargs, memory::string_view name) {
  for (const auto &[key, value] : kwargs) {
    if (key == name) {
      return &value;
    }
  }
  return nullptr;
}

} // namespace lowir::compiler
