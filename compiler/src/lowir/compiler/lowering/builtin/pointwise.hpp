#pragma once

#include "lowir/common/TensorDataType.hpp"
#include "lowir/compiler/ir/IRGraph.hpp"
#include "lowir/compiler/ir/Value.hpp"
#include "lowir/memory/container/optional.hpp"
#include "lowir/memory/container/span.hpp"
#include "lowir/memory/container/string.hpp"
#include "lowir/memory/container/vector.hpp"

namespace lowir::compiler {

class GraphLowering;

// Operand of a new computation reading `tensor`. Unrealized reductions are
// realized first, they are never inlined into a consumer.
IRNodeId load_operand(IRGraph &ir, IRNodeId tensor);

memory::vector<Sym> broadcast_shapes(const ShapeEnv &env,
                                     memory::span<const Sym> lhs,
                                     memory::span<const Sym> rhs);

// Type promotion over tensor and scalar operands.
TensorDataType promote_types(const IRGraph &ir,
                             memory::span<const Value> operands);

// Unrealized elementwise `fn` over broadcast tensor operands and literal
// scalars. Returns a tensor handle.
IRNodeId make_pointwise(GraphLowering &graph, memory::string fn,
                        memory::span<const Value> operands,
                        memory::optional<TensorDataType> dtype = {});

// other * alpha, folded when both are literals.
Value scale_by_alpha(GraphLowering &graph, const Value &other,
                     const Value &alpha);

} // namespace lowir::compiler
