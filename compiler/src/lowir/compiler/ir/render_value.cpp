#include "lowir/compiler/ir/render_value.hpp"
#include <fmt/format.h>

namespace lowir::compiler {

memory::string render_value(const IRGraph &ir, const Value &value) {
  switch (value.tag()) {
  case ValueKind::None:
    return "None";
  case ValueKind::Tensor:
    return ir.render(value.tensor());
  case ValueKind::Int:
    return ir.shapeEnv().to_string(value.integer());
  case ValueKind::Float:
    return fmt::format("{}", value.floating());
  case ValueKind::Bool:
    return value.boolean() ? "True" : "False";
  case ValueKind::String:
    return fmt::format("'{}'", value.string());
  case ValueKind::List: {
    memory::string out = "[";
    const auto &list = value.list();
    for (std::size_t i = 0; i < list.size(); ++i) {
      if (i != 0) {
        out += ", ";
      }
      out += render_value(ir, list[i]);
    }
    out += "]";
    return out;
  }
  }
  return {};
}

memory::string render_args(const IRGraph &ir, memory::span<const Value> args,
                           const KwArgs &kwargs) {
  memory::string out = "(";
  bool first = true;
  for (const Value &arg : args) {
    if (!first) {
      out += ", ";
    }
    first = false;
    out += render_value(ir, arg);
  }
  for (const auto &[key, arg] : kwargs) {
    if (!first) {
      out += ", ";
    }
    first = false;
    out += fmt::format("{}={}", key, render_value(ir, arg));
  }
  out += ")";
  return out;
}

} // namespace lowir::compiler
