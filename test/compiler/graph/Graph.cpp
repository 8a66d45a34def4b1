#include "compiler/lowering_fixtures.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace lowir;
using namespace lowir::compiler;
using namespace lowir::compiler::fixtures;

TEST(graph, DefaultNodeHasNoId) {
  const Node node{};
  EXPECT_FALSE(node.id);
  EXPECT_TRUE(node.users.empty());

  Graph graph;
  EXPECT_FALSE(graph.hasOutput());
  EXPECT_FALSE(graph.outputNode());
}

TEST(graph, NodesAreNumberedInTraceOrder) {
  Graph graph;
  auto x = graph.placeholder("x", f32({4}));
  auto r = graph.call(ops::aten("relu"), {x}, f32({4}));
  auto n = graph.call(ops::aten("neg"), {x}, f32({4}));
  auto sum = graph.call(ops::aten("add", "Tensor"), {r, n}, f32({4}));
  auto out = graph.output({sum});

  ASSERT_EQ(graph.size(), 5u);
  EXPECT_EQ(graph[x].id, x);
  EXPECT_EQ(graph[sum].id, sum);
  EXPECT_EQ(*r, 1u);
  EXPECT_EQ(graph.outputNode(), out);
  EXPECT_TRUE(graph.hasOutput());

  EXPECT_EQ(graph[x].users, (std::vector<memory::NodeId>{r, n}));
  EXPECT_EQ(graph[sum].users, (std::vector<memory::NodeId>{out}));
  EXPECT_EQ(graph[out].kind, NodeKind::Output);
  EXPECT_TRUE(graph[r].isCallTo(ops::aten("relu")));
}

TEST(graph, CallNamesAreUnique) {
  Graph graph;
  auto x = graph.placeholder("x", f32({4}));
  auto a = graph.call(ops::aten("relu"), {x}, f32({4}));
  auto b = graph.call(ops::aten("relu"), {a}, f32({4}));
  auto c = graph.getAttr("layer.weight", f32({4}));

  EXPECT_EQ(graph[a].name, "relu");
  EXPECT_EQ(graph[b].name, "relu_1");
  EXPECT_EQ(graph[c].name, "layer_weight");
}

TEST(graph, InvalidConstruction) {
  Graph graph;
  auto x = graph.placeholder("x", f32({4}));
  EXPECT_THROW(graph.placeholder("x", f32({4})), std::logic_error);
  EXPECT_THROW(graph[memory::NodeId{7}], std::invalid_argument);

  graph.output({x});
  EXPECT_THROW(graph.call(ops::aten("relu"), {x}, f32({4})),
               std::logic_error);
}
