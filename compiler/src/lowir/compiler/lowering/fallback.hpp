#pragma once

#include "lowir/compiler/graph/Node.hpp"
#include "lowir/compiler/graph/OpOverload.hpp"
#include "lowir/compiler/ir/Value.hpp"
#include "lowir/compiler/lowering/LoweringFn.hpp"
#include "lowir/memory/container/span.hpp"

namespace lowir::compiler {

class GraphLowering;

// Lowers `node` into a call of the opaque `kernel`. Tensor arguments are
// realized; the output layout is taken from the node's example value.
Value make_fallback_kernel(GraphLowering &graph, const Node &node,
                           const OpOverload &kernel,
                           memory::span<const Value> args,
                           const KwArgs &kwargs);

LoweringFn fallback_handler(OpOverload kernel);

} // namespace lowir::compiler
