#pragma once

#include "lowir/compiler/graph/Argument.hpp"
#include "lowir/compiler/graph/NodeMeta.hpp"
#include "lowir/compiler/graph/OpOverload.hpp"
#include "lowir/compiler/lowering/LoweringFn.hpp"
#include "lowir/memory/NodeId.hpp"
#include "lowir/memory/container/string.hpp"
#include "lowir/memory/container/vector.hpp"
#include <utility>

namespace lowir::compiler {

enum class NodeKind {
  Placeholder,
  GetAttr,
  CallFunction,
  Output,
};

struct Node {
  memory::NodeId id{};
  NodeKind kind;
  memory::string name;
  // Operator of a CallFunction node.
  OpOverload target;
  // Attribute path of a GetAttr node.
  memory::string attrTarget;
  memory::vector<Argument> args;
  memory::vector<std::pair<memory::string, Argument>> kwargs;
  NodeMeta meta;
  // Distinct consumers in insertion order.
  memory::vector<memory::NodeId> users;
  // Handler bound by an earlier rewrite, bypasses the registry.
  LoweringFn directLowering;

  bool isCall() const { return kind == NodeKind::CallFunction; }
  bool isCallTo(const OpOverload &op) const {
    return kind == NodeKind::CallFunction && target == op;
  }
};

} // namespace lowir::compiler

template <> struct fmt::formatter<lowir::compiler::NodeKind> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(lowir::compiler::NodeKind kind, FormatContext &ctx) const {
    using enum lowir::compiler::NodeKind;
    std::string_view name;
    switch (kind) {
    case Placeholder:
      name = "placeholder";
      break;
    case GetAttr:
      name = "get_attr";
      break;
    case CallFunction:
      name = "call_function";
      break;
    case Output:
      name = "output";
      break;
    }
    return fmt::format_to(ctx.out(), "{}", name);
  }
};

template <> struct fmt::formatter<lowir::compiler::Node> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const lowir::compiler::Node &node, FormatContext &ctx) const {
    if (node.kind == lowir::compiler::NodeKind::CallFunction) {
      return fmt::format_to(ctx.out(), "%{} = {}[{}]", node.name, node.kind,
                            node.target);
    }
    return fmt::format_to(ctx.out(), "%{} = {}", node.name, node.kind);
  }
};
