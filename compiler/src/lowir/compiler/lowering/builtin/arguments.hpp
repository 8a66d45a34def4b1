#pragma once

#include "lowir/compiler/ir/IRNodeId.hpp"
#include "lowir/compiler/ir/Value.hpp"
#include "lowir/diag/invalid_argument.hpp"
#include "lowir/memory/container/span.hpp"
#include "lowir/memory/container/string_view.hpp"
#include "lowir/memory/container/vector.hpp"
#include "lowir/symbolic/Sym.hpp"
#include <fmt/format.h>

namespace lowir::compiler {

// Positional argument `index`, or the keyword argument `name`; nullptr if
// neither was passed.
inline const Value *arg_or_kwarg(memory::span<const Value> args,
                                 const KwArgs &kwargs, std::size_t index,
                                 memory::string_view name) {
  if (index < args.size()) {
    return &args[index];
  }
  return find_kwarg(kwargs, name);
}

inline IRNodeId tensor_arg(memory::span<const Value> args, std::size_t index) {
  if (index >= args.size() || !args[index].isTensor()) {
    diag::invalid_argument(
        fmt::format("expected a tensor as argument {}", index));
  }
  return args[index].tensor();
}

inline Sym int_value(const Value &value) {
  if (value.tag() != ValueKind::Int) {
    diag::invalid_argument("expected an integer argument");
  }
  return value.integer();
}

inline std::int64_t const_int_value(const Value &value) {
  const Sym s = int_value(value);
  if (!s.isConstant()) {
    diag::invalid_argument("expected a static integer argument");
  }
  return s.constant();
}

// A list of integers; a single integer is broadcast to `rank` entries.
inline memory::vector<Sym> ints_value(const Value &value,
                                      std::size_t rank = 1) {
  if (value.tag() == ValueKind::Int) {
    return memory::vector<Sym>(rank, value.integer());
  }
  if (value.tag() != ValueKind::List) {
    diag::invalid_argument("expected a list of integers");
  }
  memory::vector<Sym> out;
  for (const Value &v : value.list()) {
    out.push_back(int_value(v));
  }
  return out;
}

inline memory::vector<std::int64_t> const_ints_value(const Value &value,
                                                     std::size_t rank = 1) {
  memory::vector<std::int64_t> out;
  for (const Sym &s : ints_value(value, rank)) {
    if (!s.isConstant()) {
      diag::invalid_argument("expected a list of static integers");
    }
    out.push_back(s.constant());
  }
  return out;
}

inline bool bool_value(const Value &value) {
  if (value.tag() == ValueKind::Bool) {
    return value.boolean();
  }
  return const_int_value(value) != 0;
}

// Normalizes a possibly negative dimension index.
inline std::size_t wrap_dim(std::int64_t dim, std::size_t rank) {
  const std::int64_t r = static_cast<std::int64_t>(rank == 0 ? 1 : rank);
  if (dim < -r || dim >= r) {
    diag::invalid_argument(
        fmt::format("dimension {} out of range for rank {}", dim, rank));
  }
  return static_cast<std::size_t>(dim < 0 ? dim + r : dim);
}

} // namespace lowir::compiler
