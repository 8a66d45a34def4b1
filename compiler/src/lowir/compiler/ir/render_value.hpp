#pragma once

#include "lowir/compiler/ir/IRGraph.hpp"
#include "lowir/compiler/ir/Value.hpp"
#include "lowir/memory/container/span.hpp"
#include "lowir/memory/container/string.hpp"

namespace lowir::compiler {

// Source-like text of a lowered value, e.g. "[buf0, s0 + 1, None]".
memory::string render_value(const IRGraph &ir, const Value &value);

// "(a, b, key=c)"
memory::string render_args(const IRGraph &ir, memory::span<const Value> args,
                           const KwArgs &kwargs);

} // namespace lowir::compiler
