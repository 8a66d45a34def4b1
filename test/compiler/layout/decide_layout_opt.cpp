#include "lowir/compiler/layout/decide_layout_opt.hpp"
#include <gtest/gtest.h>

using namespace lowir;
using namespace lowir::compiler;

namespace {

Argument conv_args(memory::NodeId input, memory::NodeId weight,
                   std::int64_t groups = 1) {
  return Argument{Argument::List{
      input,
      weight,
      Argument{},
      Argument::Ints({1, 1}),
      Argument::Ints({1, 1}),
      Argument::Ints({1, 1}),
      Argument::Bool(false),
      Argument::Ints({0, 0}),
      Argument::Int(groups),
  }};
}

// x -> conv(x, w) -> relu -> output
struct ConvGraph {
  Graph graph;
  memory::NodeId x;
  memory::NodeId w;
  memory::NodeId conv;
  memory::NodeId relu;

  ConvGraph(std::int64_t inChannels, std::int64_t outChannels,
            std::int64_t groups = 1, bool dynamic = false,
            Device device = Device::cpu()) {
    x = graph.placeholder(
        "x", TensorMeta::contiguous({1, inChannels, 16, 16},
                                    TensorDataType::Float32, device, dynamic));
    w = graph.placeholder(
        "w", TensorMeta::contiguous({outChannels, inChannels / groups, 3, 3},
                                    TensorDataType::Float32, device));
    conv = graph.call(ops::aten("convolution"),
                      conv_args(x, w, groups).list(),
                      TensorMeta::contiguous({1, outChannels, 16, 16},
                                             TensorDataType::Float32, device));
    relu = graph.call(ops::aten("relu"), {conv},
                      TensorMeta::contiguous({1, outChannels, 16, 16},
                                             TensorDataType::Float32, device));
    graph.output({relu});
  }
};

} // namespace

TEST(layout_decide_layout_opt, NoConvolutions) {
  Graph graph;
  auto x = graph.placeholder("x", TensorMeta::contiguous({4, 4}));
  auto r = graph.call(ops::aten("relu"), {x}, TensorMeta::contiguous({4, 4}));
  graph.output({r});
  EXPECT_FALSE(decide_layout_opt(graph, LayoutHeuristics{}, RuntimeInfo{}));
}

TEST(layout_decide_layout_opt, LargeChannelConvolution) {
  ConvGraph g(128, 256);
  EXPECT_TRUE(decide_layout_opt(g.graph, LayoutHeuristics{}, RuntimeInfo{}));
}

TEST(layout_decide_layout_opt, Disabled) {
  ConvGraph g(128, 256);
  LayoutHeuristics heuristics;
  heuristics.layoutOptimization = false;
  EXPECT_FALSE(decide_layout_opt(g.graph, heuristics, RuntimeInfo{}));
}

TEST(layout_decide_layout_opt, Forced) {
  Graph graph;
  auto x = graph.placeholder("x", TensorMeta::contiguous({4, 4}));
  graph.output({x});
  LayoutHeuristics heuristics;
  heuristics.forceLayoutOptimization = true;
  EXPECT_TRUE(decide_layout_opt(graph, heuristics, RuntimeInfo{}));
}

TEST(layout_decide_layout_opt, SmallChannels) {
  ConvGraph g(16, 32);
  EXPECT_FALSE(decide_layout_opt(g.graph, LayoutHeuristics{}, RuntimeInfo{}));
}

TEST(layout_decide_layout_opt, GroupedConvolution) {
  ConvGraph g(128, 256, 2);
  EXPECT_FALSE(decide_layout_opt(g.graph, LayoutHeuristics{}, RuntimeInfo{}));
}

TEST(layout_decide_layout_opt, ChannelReduction) {
  // fewer than half as many outputs as inputs with a spatial kernel
  ConvGraph g(512, 128);
  EXPECT_FALSE(decide_layout_opt(g.graph, LayoutHeuristics{}, RuntimeInfo{}));
}

TEST(layout_decide_layout_opt, DynamicOperands) {
  ConvGraph g(128, 256, 1, true);
  EXPECT_FALSE(decide_layout_opt(g.graph, LayoutHeuristics{}, RuntimeInfo{}));
}

TEST(layout_decide_layout_opt, SparseConvolutions) {
  ConvGraph g(128, 256);
  LayoutHeuristics heuristics;
  heuristics.nodesPerConvThreshold = 2;
  EXPECT_FALSE(decide_layout_opt(g.graph, heuristics, RuntimeInfo{}));
}

TEST(layout_decide_layout_opt, RocmGpu) {
  ConvGraph g(128, 256, 1, false, Device::cuda());
  RuntimeInfo runtime;
  runtime.hip = true;
  runtime.gpuAvailable = true;
  EXPECT_FALSE(decide_layout_opt(g.graph, LayoutHeuristics{}, runtime));
}

TEST(layout_decide_layout_opt, MkldnnOnCpuOverridesChannelHeuristics) {
  ConvGraph g(16, 32);
  RuntimeInfo runtime;
  runtime.mkldnnAvailable = true;
  EXPECT_TRUE(decide_layout_opt(g.graph, LayoutHeuristics{}, runtime));
}

TEST(layout_decide_layout_opt, AttentionDisables) {
  Graph graph;
  auto x = graph.placeholder("x", TensorMeta::contiguous({1, 128, 16, 16},
                                                         TensorDataType::Float32,
                                                         Device::cuda()));
  auto w = graph.placeholder("w", TensorMeta::contiguous({256, 128, 3, 3},
                                                         TensorDataType::Float32,
                                                         Device::cuda()));
  auto conv = graph.call(ops::aten("convolution"), conv_args(x, w).list(),
                         TensorMeta::contiguous({1, 256, 16, 16},
                                                TensorDataType::Float32,
                                                Device::cuda()));
  auto attn = graph.call(ops::aten("_scaled_dot_product_flash_attention"),
                         {conv, conv, conv});
  graph.output({conv, attn});
  EXPECT_FALSE(decide_layout_opt(graph, LayoutHeuristics{}, RuntimeInfo{}));
}

TEST(layout_prefer_channels_last, ProducersAndConsumersOfConvolutions) {
  Graph graph;
  auto x = graph.placeholder("x", TensorMeta::contiguous({1, 128, 16, 16}));
  auto w = graph.placeholder("w", TensorMeta::contiguous({256, 128, 3, 3}));
  auto y = graph.placeholder("y", TensorMeta::contiguous({4}));
  auto pre = graph.call(ops::aten("relu"), {x},
                        TensorMeta::contiguous({1, 128, 16, 16}));
  auto conv = graph.call(ops::aten("convolution"), conv_args(pre, w).list(),
                         TensorMeta::contiguous({1, 256, 16, 16}));
  auto post = graph.call(ops::aten("relu"), {conv},
                         TensorMeta::contiguous({1, 256, 16, 16}));
  auto unrelated =
      graph.call(ops::aten("neg"), {y}, TensorMeta::contiguous({4}));
  graph.output({post, unrelated});

  auto preferred = find_nodes_prefer_channels_last(graph);
  EXPECT_TRUE(preferred.contains(conv));
  EXPECT_TRUE(preferred.contains(pre));
  EXPECT_TRUE(preferred.contains(x));
  EXPECT_TRUE(preferred.contains(w));
  EXPECT_TRUE(preferred.contains(post));
  EXPECT_FALSE(preferred.contains(y));
  EXPECT_FALSE(preferred.contains(unrelated));
}
