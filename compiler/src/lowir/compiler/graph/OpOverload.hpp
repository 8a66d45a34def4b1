#pragma once

#include "lowir/algorithm/hash_combine.hpp"
#include "lowir/memory/container/string.hpp"
#include "lowir/memory/container/string_view.hpp"
#include <fmt/core.h>

namespace lowir::compiler {

// Operator identity, e.g. "aten::convolution.default".
struct OpOverload {
  memory::string ns;
  memory::string name;
  memory::string overload;

  // Parses "ns::name" or "ns::name.overload".
  static OpOverload parse(memory::string_view qualified);

  // "ns::name", the overload packet shared by all overloads.
  memory::string baseName() const { return ns + "::" + name; }

  // "ns::name.overload", or "ns::name" without an overload.
  memory::string fullName() const {
    if (overload.empty()) {
      return baseName();
    }
    return baseName() + "." + overload;
  }

  // Dotted form used in diagnostics, e.g. "aten.mm.default".
  memory::string dottedName() const {
    memory::string s = ns + "." + name;
    if (!overload.empty()) {
      s += "." + overload;
    }
    return s;
  }

  bool sameBase(const OpOverload &other) const {
    return ns == other.ns && name == other.name;
  }

  friend bool operator==(const OpOverload &, const OpOverload &) = default;
};

inline OpOverload OpOverload::parse(memory::string_view qualified) {
  OpOverload op;
  const auto sep = qualified.find("::");
  memory::string_view rest = qualified;
  if (sep != memory::string_view::npos) {
    op.ns = memory::string(qualified.substr(0, sep));
    rest = qualified.substr(sep + 2);
  }
  const auto dot = rest.find('.');
  if (dot == memory::string_view::npos) {
    op.name = memory::string(rest);
  } else {
    op.name = memory::string(rest.substr(0, dot));
    op.overload = memory::string(rest.substr(dot + 1));
  }
  return op;
}

namespace ops {

inline OpOverload aten(memory::string_view name,
                       memory::string_view overload = "default") {
  return OpOverload{"aten", memory::string(name), memory::string(overload)};
}

} // namespace ops

} // namespace lowir::compiler

template <> struct std::hash<lowir::compiler::OpOverload> {
  size_t operator()(const lowir::compiler::OpOverload &op) const noexcept {
    size_t hash = std::hash<std::string>{}(op.ns);
    hash = lowir::algorithm::hash_combine(hash, op.name);
    return lowir::algorithm::hash_combine(hash, op.overload);
  }
};

template <> struct fmt::formatter<lowir::compiler::OpOverload> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const lowir::compiler::OpOverload &op,
              FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}", op.fullName());
  }
};
