#include "lowir/compiler/lowering/constraints.hpp"
#include "lowir/compiler/GraphLowering.hpp"
#include "lowir/compiler/ir/stride_order.hpp"

namespace lowir::compiler {

namespace {

void apply_constraint(GraphLowering &graph, Value &arg,
                      const Argument &traced) {
  if (!arg.isTensor() || !traced.isNode()) {
    return;
  }
  const NodeMeta &meta = graph.graph()[traced.node()].meta;
  if (!meta.isTensor() || meta.tensor().dim() != graph.ir().sizes(arg.tensor()).size()) {
    return;
  }
  const StrideOrder order = get_stride_order(meta.tensor().strides);
  arg = graph.ir().requireStrideOrder(arg.tensor(), order);
}

} // namespace

void constrain_to_fx_strides(GraphLowering &graph, const Node &node,
                             memory::vector<Value> &args, KwArgs &kwargs) {
  for (std::size_t i = 0; i < args.size() && i < node.args.size(); ++i) {
    apply_constraint(graph, args[i], node.args[i]);
  }
  for (auto &[key, value] : kwargs) {
    for (const auto &[tracedKey, traced] : node.kwargs) {
      if (tracedKey == key) {
        apply_constraint(graph, value, traced);
      }
    }
  }
}

} // namespace lowir::compiler
