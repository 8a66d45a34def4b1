#pragma once

#include "lowir/compiler/graph/Node.hpp"
#include "lowir/compiler/ir/Value.hpp"
#include "lowir/memory/container/vector.hpp"

namespace lowir::compiler {

class GraphLowering;

// Requires every tensor argument to keep the stride order of the example
// value it was traced with.
void constrain_to_fx_strides(GraphLowering &graph, const Node &node,
                             memory::vector<Value> &args, KwArgs &kwargs);

} // namespace lowir::compiler
