#pragma once

#include "lowir/compiler/graph/TensorMeta.hpp"
#include "lowir/memory/container/vector.hpp"
#include "lowir/symbolic/Sym.hpp"
#include <cassert>
#include <variant>

namespace lowir::compiler {

enum class NodeMetaKind {
  None,
  Tensor,
  SymInt,
  Int,
  Float,
  Bool,
  TensorList,
};

// The statically known example value of a node.
class NodeMeta {
public:
  NodeMeta() = default;
  NodeMeta(TensorMeta tensor) : m_var(std::move(tensor)) {}
  NodeMeta(Sym sym) : m_var(sym) {}
  NodeMeta(memory::vector<TensorMeta> tensors) : m_var(std::move(tensors)) {}

  static NodeMeta Int(std::int64_t v) { return NodeMeta{Tag{}, v}; }
  static NodeMeta Float(double v) { return NodeMeta{Tag{}, v}; }
  static NodeMeta Bool(bool v) { return NodeMeta{Tag{}, v}; }

  NodeMetaKind tag() const {
    switch (m_var.index()) {
    case 0:
      return NodeMetaKind::None;
    case 1:
      return NodeMetaKind::Tensor;
    case 2:
      return NodeMetaKind::SymInt;
    case 3:
      return NodeMetaKind::Int;
    case 4:
      return NodeMetaKind::Float;
    case 5:
      return NodeMetaKind::Bool;
    default:
      return NodeMetaKind::TensorList;
    }
  }

  bool isTensor() const { return tag() == NodeMetaKind::Tensor; }
  bool isSymbolic() const {
    return tag() == NodeMetaKind::SymInt && std::get<Sym>(m_var).isSymbolic();
  }

  const TensorMeta &tensor() const {
    assert(std::holds_alternative<TensorMeta>(m_var));
    return std::get<TensorMeta>(m_var);
  }

  Sym symInt() const {
    assert(std::holds_alternative<Sym>(m_var));
    return std::get<Sym>(m_var);
  }

  std::int64_t integer() const {
    assert(std::holds_alternative<std::int64_t>(m_var));
    return std::get<std::int64_t>(m_var);
  }

  double floating() const {
    assert(std::holds_alternative<double>(m_var));
    return std::get<double>(m_var);
  }

  bool boolean() const {
    assert(std::holds_alternative<bool>(m_var));
    return std::get<bool>(m_var);
  }

  const memory::vector<TensorMeta> &tensors() const {
    assert(std::holds_alternative<memory::vector<TensorMeta>>(m_var));
    return std::get<memory::vector<TensorMeta>>(m_var);
  }

private:
  struct Tag {};
  template <typename T> NodeMeta(Tag, T v) : m_var(std::move(v)) {}

  std::variant<std::monostate, TensorMeta, Sym, std::int64_t, double, bool,
               memory::vector<TensorMeta>>
      m_var;
};

} // namespace lowir::compiler
