#pragma once

#include "lowir/memory/NodeId.hpp"
#include "lowir/memory/container/string.hpp"
#include "lowir/memory/container/vector.hpp"
#include <cassert>
#include <cstdint>
#include <variant>

namespace lowir::compiler {

enum class ArgumentKind {
  None,
  Node,
  Int,
  Float,
  Bool,
  String,
  List,
};

// Argument of a traced call: either a reference to a previous node or a
// literal.
class Argument {
public:
  using List = memory::vector<Argument>;

  Argument() = default;
  Argument(memory::NodeId node) : m_var(node) {}
  Argument(List list) : m_var(std::move(list)) {}

  static Argument Int(std::int64_t v) { return Argument{Tag{}, v}; }
  static Argument Float(double v) { return Argument{Tag{}, v}; }
  static Argument Bool(bool v) { return Argument{Tag{}, v}; }
  static Argument String(memory::string v) {
    return Argument{Tag{}, std::move(v)};
  }
  static Argument Ints(std::initializer_list<std::int64_t> values) {
    List list;
    for (std::int64_t v : values) {
      list.push_back(Int(v));
    }
    return Argument{std::move(list)};
  }

  ArgumentKind tag() const {
    switch (m_var.index()) {
    case 0:
      return ArgumentKind::None;
    case 1:
      return ArgumentKind::Node;
    case 2:
      return ArgumentKind::Int;
    case 3:
      return ArgumentKind::Float;
    case 4:
      return ArgumentKind::Bool;
    case 5:
      return ArgumentKind::String;
    default:
      return ArgumentKind::List;
    }
  }

  bool isNone() const { return tag() == ArgumentKind::None; }
  bool isNode() const { return tag() == ArgumentKind::Node; }

  memory::NodeId node() const {
    assert(std::holds_alternative<memory::NodeId>(m_var));
    return std::get<memory::NodeId>(m_var);
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

  const memory::string &string() const {
    assert(std::holds_alternative<memory::string>(m_var));
    return std::get<memory::string>(m_var);
  }

  const List &list() const {
    assert(std::holds_alternative<List>(m_var));
    return std::get<List>(m_var);
  }

  // Invokes f on every node referenced by this argument, including nested
  // list elements.
  template <typename F> void forEachNode(F &&f) const {
    if (isNode()) {
      f(node());
    } else if (tag() == ArgumentKind::List) {
      for (const auto &a : list()) {
        a.forEachNode(f);
      }
    }
  }

private:
  struct Tag {};
  template <typename T> Argument(Tag, T v) : m_var(std::move(v)) {}

  std::variant<std::monostate, memory::NodeId, std::int64_t, double, bool,
               memory::string, List>
      m_var;
};

} // namespace lowir::compiler
