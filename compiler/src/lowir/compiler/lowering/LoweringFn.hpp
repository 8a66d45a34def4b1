#pragma once

#include "lowir/compiler/ir/Value.hpp"
#include "lowir/memory/container/span.hpp"
#include "lowir/memory/container/vector.hpp"
#include <functional>

namespace lowir::compiler {

class GraphLowering;
struct Node;

// Lowers one call node given its already lowered arguments.
using LoweringFn =
    std::function<Value(GraphLowering &, const Node &,
                        memory::span<const Value>, const KwArgs &)>;

// Coerces the arguments of a call before it is lowered.
using LayoutConstraint = std::function<void(
    GraphLowering &, const Node &, memory::vector<Value> &, KwArgs &)>;

} // namespace lowir::compiler
