#include "lowir/compiler/layout/decide_layout_opt.hpp"
#include "lowir/compiler/graph/OpOverload.hpp"
#include "lowir/diag/logging.hpp"
#include "lowir/memory/container/vector.hpp"
#include <algorithm>

namespace lowir::compiler {

namespace {

const OpOverload &convolution_op() {
  static const OpOverload op = ops::aten("convolution");
  return op;
}

bool is_sdpa(const Node &node) {
  static const OpOverload flash =
      ops::aten("_scaled_dot_product_flash_attention");
  static const OpOverload efficient =
      ops::aten("_scaled_dot_product_efficient_attention");
  return node.isCall() &&
         (node.target.sameBase(flash) || node.target.sameBase(efficient));
}

// Example tensor of a convolution operand, nullptr if the operand is not a
// tensor-valued node.
const TensorMeta *operand_meta(const Graph &graph, const Node &conv,
                               std::size_t idx) {
  if (idx >= conv.args.size() || !conv.args[idx].isNode()) {
    return nullptr;
  }
  const Node &producer = graph[conv.args[idx].node()];
  if (!producer.meta.isTensor()) {
    return nullptr;
  }
  return &producer.meta.tensor();
}

std::int64_t conv_groups(const Node &conv) {
  if (conv.args.empty() || conv.args.back().tag() != ArgumentKind::Int) {
    return 1;
  }
  return conv.args.back().integer();
}

} // namespace

bool decide_layout_opt(const Graph &graph, const LayoutHeuristics &heuristics,
                       const RuntimeInfo &runtime) {
  if (!heuristics.layoutOptimization) {
    return false;
  }
  if (heuristics.forceLayoutOptimization) {
    return true;
  }

  memory::vector<const Node *> convs;
  for (const Node &node : graph.nodes()) {
    if (node.isCallTo(convolution_op())) {
      convs.push_back(&node);
    }
  }
  const std::int64_t nconv = static_cast<std::int64_t>(convs.size());
  if (nconv == 0) {
    return false;
  }

  // channels-last convolutions are known to regress on ROCm
  if (runtime.hip && runtime.gpuAvailable) {
    return false;
  }

  const bool allOnCpu = std::all_of(convs.begin(), convs.end(), [&](const Node *n) {
    for (std::size_t idx : {std::size_t{0}, std::size_t{1}}) {
      const TensorMeta *meta = operand_meta(graph, *n, idx);
      if (meta == nullptr || !meta->device.isCpu()) {
        return false;
      }
    }
    return true;
  });
  if (allOnCpu && runtime.mkldnnEnabled && runtime.mkldnnAvailable) {
    LOWIR_DEBUG("layout opt enabled: all convolutions take the mkldnn path");
    return true;
  }

  const std::int64_t nodeCount = static_cast<std::int64_t>(graph.size());
  if (nodeCount >= heuristics.nodesPerConvThreshold * nconv) {
    LOWIR_DEBUG("skipped layout opt: only {} convolutions in {} nodes", nconv,
                nodeCount);
    return false;
  }

  for (const Node *n : convs) {
    for (std::size_t idx : {std::size_t{0}, std::size_t{1}}) {
      const TensorMeta *meta = operand_meta(graph, *n, idx);
      if (meta != nullptr && meta->dynamic) {
        LOWIR_DEBUG("skipped layout opt: {} has dynamic operands", n->name);
        return false;
      }
    }
  }

  auto weight_dim = [&](const Node *n, std::size_t d) -> std::int64_t {
    const TensorMeta *weight = operand_meta(graph, *n, 1);
    if (weight == nullptr || d >= weight->dim()) {
      return 1;
    }
    return weight->sizes[d];
  };

  for (const Node *n : convs) {
    if (conv_groups(*n) > 1 && weight_dim(n, 1) > 1) {
      LOWIR_DEBUG("skipped layout opt: {} is a grouped convolution", n->name);
      return false;
    }
  }

  for (const Node *n : convs) {
    if (weight_dim(n, 0) * 2 <= weight_dim(n, 1) && weight_dim(n, 2) > 1) {
      LOWIR_DEBUG(
          "skipped layout opt: {} has fewer than half as many outputs as "
          "input channels",
          n->name);
      return false;
    }
  }

  const bool allSmall =
      std::all_of(convs.begin(), convs.end(), [&](const Node *n) {
        return weight_dim(n, 0) <= heuristics.smallChannelBound &&
               weight_dim(n, 1) <= heuristics.smallChannelBound;
      });
  if (allSmall) {
    LOWIR_DEBUG("skipped layout opt: all convolutions have small channels");
    return false;
  }

  for (const Node &node : graph.nodes()) {
    if (is_sdpa(node)) {
      LOWIR_DEBUG("skipped layout opt: graph contains {}", node.target);
      return false;
    }
  }

  return true;
}

memory::hash_set<memory::NodeId>
find_nodes_prefer_channels_last(const Graph &graph) {
  memory::hash_set<memory::NodeId> preferred;
  const auto nodes = graph.nodes();

  for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
    const Node &node = *it;
    if (node.isCallTo(convolution_op())) {
      preferred.insert(node.id);
      continue;
    }
    for (memory::NodeId user : node.users) {
      if (preferred.contains(user)) {
        preferred.insert(node.id);
        break;
      }
    }
  }

  // Forward pass: consumers of preferred nodes inherit the preference, which
  // keeps e.g. a normalization between two convolutions channels-last.
  for (const Node &node : nodes) {
    if (preferred.contains(node.id)) {
      for (memory::NodeId user : node.users) {
        preferred.insert(user);
      }
    }
  }
  return preferred;
}

} // namespace lowir::compiler
