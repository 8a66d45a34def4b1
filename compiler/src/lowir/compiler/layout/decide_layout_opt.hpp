#pragma once

#include "lowir/compiler/Options.hpp"
#include "lowir/compiler/graph/Graph.hpp"
#include "lowir/memory/NodeId.hpp"
#include "lowir/memory/container/hashset.hpp"

namespace lowir::compiler {

// Decides once per graph whether convolutions and their neighbourhood should
// use the channels-last layout.
bool decide_layout_opt(const Graph &graph, const LayoutHeuristics &heuristics,
                       const RuntimeInfo &runtime);

// Nodes that should produce channels-last outputs: every convolution, every
// producer that (transitively) feeds one, and every consumer reachable from
// any of those.
memory::hash_set<memory::NodeId>
find_nodes_prefer_channels_last(const Graph &graph);

} // namespace lowir::compiler
