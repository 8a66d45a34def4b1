#include "compiler/lowering_fixtures.hpp"
#include <fmt/format.h>
#include <gtest/gtest.h>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>

using namespace lowir;
using namespace lowir::compiler;
using namespace lowir::compiler::fixtures;

namespace {

std::vector<Sym> consts(std::initializer_list<std::int64_t> values) {
  std::vector<Sym> out;
  for (std::int64_t v : values) {
    out.push_back(Sym::Const(v));
  }
  return out;
}

// 3x3 convolution, stride 1, padding 1.
memory::vector<Argument> conv_args(memory::NodeId input,
                                   memory::NodeId weight) {
  return {
      input,
      weight,
      Argument{},
      Argument::Ints({1, 1}),
      Argument::Ints({1, 1}),
      Argument::Ints({1, 1}),
      Argument::Bool(false),
      Argument::Ints({0, 0}),
      Argument::Int(1),
  };
}

// x -> conv(x, w) -> relu -> output
struct ConvRelu {
  Graph graph;
  memory::NodeId conv;
  memory::NodeId relu;

  ConvRelu() {
    auto x = graph.placeholder("x", f32({1, 128, 16, 16}));
    auto w = graph.placeholder("w", f32({256, 128, 3, 3}));
    conv = graph.call(ops::aten("convolution"), conv_args(x, w),
                      f32({1, 256, 16, 16}));
    relu = graph.call(ops::aten("relu"), {conv}, f32({1, 256, 16, 16}));
    graph.output({relu});
  }
};

} // namespace

TEST(graph_lowering, DynamicPointwiseChain) {
  LoweringRegistry registry;
  Graph graph;
  auto x = graph.placeholder("x", dynamic_f32({4, 8}));
  auto y = graph.placeholder("y", dynamic_f32({4, 8}));
  auto sum = graph.call(ops::aten("add", "Tensor"), {x, y}, dynamic_f32({4, 8}));
  auto relu = graph.call(ops::aten("relu"), {sum}, dynamic_f32({4, 8}));
  graph.output({relu});

  GraphLowering lowering(graph, options_for(registry));
  lowering.run();

  const IRGraph &ir = lowering.ir();
  const IRNodeId xt = lowering.valueOf(x).tensor();
  const IRNodeId yt = lowering.valueOf(y).tensor();
  const auto sizes = ir.sizes(xt);
  ASSERT_EQ(sizes.size(), 2u);
  EXPECT_TRUE(sizes[0].isSymbolic());
  EXPECT_TRUE(sizes[1].isSymbolic());
  EXPECT_EQ(ir.sizes(yt), sizes);
  EXPECT_EQ(ir.layout(xt).strides, (std::vector<Sym>{sizes[1], Sym::Const(1)}));
  EXPECT_EQ(lowering.shapeEnv().to_string(sizes[0]), "s0");
  EXPECT_EQ(lowering.shapeEnv().to_string(sizes[1]), "s1");

  // the add is fused into the relu
  ASSERT_EQ(ir.buffers().size(), 1u);
  EXPECT_FALSE(ir.isRealized(lowering.valueOf(sum).tensor()));
  EXPECT_EQ(lowering.getOutputNames(), (std::vector<std::string>{"buf0"}));

  const IRNode &buffer = ir[ir.buffers()[0]];
  ASSERT_EQ(buffer.tag(), IRNodeKind::ComputedBuffer);
  EXPECT_EQ(ir.render(buffer.computed().data), "relu(add(x, y))");
  EXPECT_EQ(buffer.layout().kind, LayoutKind::Fixed);
  EXPECT_EQ(buffer.layout().sizes, sizes);
  EXPECT_EQ(buffer.origin, relu);
  EXPECT_TRUE(lowering.mutatedInputs().empty());
}

TEST(graph_lowering, StaticInputsStayConstant) {
  LoweringRegistry registry;
  Graph graph;
  auto w = graph.placeholder("w", dynamic_f32({4, 8}));
  auto x = graph.placeholder("x", dynamic_f32({4, 8}));
  auto sum = graph.call(ops::aten("add", "Tensor"), {w, x}, dynamic_f32({4, 8}));
  graph.output({sum});

  auto options = options_for(registry);
  options.numStaticInputs = 1;
  GraphLowering lowering(graph, options);
  lowering.run();

  const IRGraph &ir = lowering.ir();
  EXPECT_EQ(ir.sizes(lowering.valueOf(w).tensor()),
            (std::vector<Sym>{Sym::Const(4), Sym::Const(8)}));
  EXPECT_TRUE(ir.sizes(lowering.valueOf(x).tensor())[0].isSymbolic());
}

TEST(graph_lowering, ExpensiveSharedResultsAreRealized) {
  LoweringRegistry registry;
  Graph graph;
  auto x = graph.placeholder("x", f32({16}));
  auto e = graph.call(ops::aten("exp"), {x}, f32({16}));
  auto a = graph.call(ops::aten("relu"), {e}, f32({16}));
  auto b = graph.call(ops::aten("neg"), {e}, f32({16}));
  graph.output({a, b});

  GraphLowering lowering(graph, options_for(registry));
  lowering.run();

  const IRGraph &ir = lowering.ir();
  EXPECT_TRUE(ir.isRealized(lowering.valueOf(e).tensor()));
  EXPECT_EQ(ir.bufferName(lowering.valueOf(e).tensor()), "buf0");
  EXPECT_EQ(ir.buffers().size(), 3u);
}

TEST(graph_lowering, CheapSharedResultsAreInlined) {
  LoweringRegistry registry;
  Graph graph;
  auto x = graph.placeholder("x", f32({16}));
  auto r = graph.call(ops::aten("relu"), {x}, f32({16}));
  auto a = graph.call(ops::aten("neg"), {r}, f32({16}));
  auto b = graph.call(ops::aten("clone"), {r}, f32({16}));
  graph.output({a, b});

  GraphLowering lowering(graph, options_for(registry));
  lowering.run();

  const IRGraph &ir = lowering.ir();
  EXPECT_FALSE(ir.isRealized(lowering.valueOf(r).tensor()));
  EXPECT_EQ(ir.buffers().size(), 2u);
}

TEST(graph_lowering, AccumulatedReadsForceRealization) {
  LoweringRegistry registry;
  Graph graph;
  std::vector<memory::NodeId> inputs;
  for (int i = 0; i < 9; ++i) {
    inputs.push_back(graph.placeholder(fmt::format("x{}", i), f32({8})));
  }
  std::vector<memory::NodeId> sums;
  memory::NodeId acc = inputs[0];
  for (int i = 1; i < 9; ++i) {
    acc = graph.call(ops::aten("add", "Tensor"), {acc, inputs[i]}, f32({8}));
    sums.push_back(acc);
  }
  auto out = graph.call(ops::aten("relu"), {acc}, f32({8}));
  graph.output({out});

  GraphLowering lowering(graph, options_for(registry));
  lowering.run();

  const IRGraph &ir = lowering.ir();
  // eight buffers are still within the threshold, nine exceed it
  EXPECT_FALSE(ir.isRealized(lowering.valueOf(sums[6]).tensor()));
  EXPECT_TRUE(ir.isRealized(lowering.valueOf(sums[7]).tensor()));
  EXPECT_EQ(ir.buffers().size(), 2u);
}

TEST(graph_lowering, ReductionsAreRealizedBeforeBeingRead) {
  LoweringRegistry registry;
  Graph graph;
  auto x = graph.placeholder("x", f32({4, 8}));
  auto s = graph.call(ops::aten("sum", "dim_IntList"),
                      {x, Argument::Ints({1})}, f32({4}));
  auto r = graph.call(ops::aten("relu"), {s}, f32({4}));
  graph.output({r});

  GraphLowering lowering(graph, options_for(registry));
  lowering.run();

  const IRGraph &ir = lowering.ir();
  const IRNodeId st = lowering.valueOf(s).tensor();
  ASSERT_TRUE(ir.isRealized(st));
  EXPECT_EQ(ir.sizes(st), (std::vector<Sym>{Sym::Const(4)}));
  const IRNode &buffer = ir[ir.dataOf(st)];
  EXPECT_EQ(ir[buffer.computed().data].tag(), IRNodeKind::Reduction);
}

TEST(graph_lowering, OutputsAreRealized) {
  LoweringRegistry registry;
  Graph graph;
  auto x = graph.placeholder("x", f32({4}));
  auto n = graph.call(ops::aten("neg"), {x}, f32({4}));
  auto r = graph.call(ops::aten("relu"), {n}, f32({4}));
  graph.output({n, r});

  GraphLowering lowering(graph, options_for(registry));
  lowering.run();

  EXPECT_EQ(lowering.getOutputNames(),
            (std::vector<std::string>{"buf0", "buf1"}));
  EXPECT_EQ(lowering.graphOutputs().size(), 2u);
}

TEST(graph_lowering, ViewsAliasTheirBase) {
  LoweringRegistry registry;
  Graph graph;
  auto x = graph.placeholder("x", f32({2, 6}));
  auto r = graph.call(ops::aten("relu"), {x}, f32({2, 6}));
  auto v = graph.call(ops::aten("view"), {r, Argument::Ints({3, 4})},
                      f32({3, 4}));
  auto p = graph.call(ops::aten("permute"), {v, Argument::Ints({1, 0})},
                      TensorMeta{{4, 3}, {1, 4}});
  graph.output({p});

  GraphLowering lowering(graph, options_for(registry));
  lowering.run();

  const IRGraph &ir = lowering.ir();
  const IRNodeId pt = lowering.valueOf(p).tensor();
  ASSERT_TRUE(ir.isView(pt));
  EXPECT_EQ(ir.storageOf(pt), ir.storageOf(lowering.valueOf(r).tensor()));
  EXPECT_EQ(ir.layout(pt).strides,
            (std::vector<Sym>{Sym::Const(1), Sym::Const(4)}));
  EXPECT_EQ(ir.buffers().size(), 1u);
}

TEST(graph_lowering, Queries) {
  LoweringRegistry registry;
  Graph graph;
  auto x = graph.placeholder("x", dynamic_f32({4, 8}));
  auto s = graph.placeholder("s", f32({}));
  auto n = graph.call(ops::aten("neg"), {x}, dynamic_f32({4, 8}));
  graph.output({n, s});

  GraphLowering lowering(graph, options_for(registry));
  lowering.run();

  const auto sizes = lowering.ir().sizes(lowering.valueOf(x).tensor());
  EXPECT_EQ(lowering.getDtype("x"), TensorDataType::Float32);
  EXPECT_EQ(lowering.getDtype("buf0"), TensorDataType::Float32);
  EXPECT_EQ(lowering.getDtype("reinterpret_tensor(buf0, [32], [1], 0)"),
            TensorDataType::Float32);
  EXPECT_EQ(lowering.getDtype("as_strided(x, [4], [1])"),
            TensorDataType::Float32);
  EXPECT_THROW(lowering.getDtype("nothing"), std::invalid_argument);

  EXPECT_EQ(lowering.getNumel("buf0"),
            lowering.shapeEnv().mul(sizes[0], sizes[1]));
  EXPECT_EQ(lowering.getNumel("s"), Sym::Const(1));
  EXPECT_THROW(lowering.getNumel("nothing"), std::invalid_argument);

  EXPECT_TRUE(lowering.isUnspecArg("s"));
  EXPECT_FALSE(lowering.isUnspecArg("x"));
  EXPECT_FALSE(lowering.isUnspecArg("buf0"));

  const std::vector<std::string> names{"buf0", "s"};
  EXPECT_EQ(lowering.registerList(names), "list_buf0_s");
  EXPECT_EQ(lowering.getBuffer("x"),
            lowering.ir().dataOf(lowering.graphInputs()[0].original));
  EXPECT_FALSE(lowering.getBuffer("nothing").has_value());
}

TEST(graph_lowering, MalformedGraphs) {
  LoweringRegistry registry;
  Graph noOutput;
  noOutput.placeholder("x", f32({4}));
  GraphLowering a(noOutput, options_for(registry));
  EXPECT_THROW(a.run(), std::logic_error);

  Graph listInput;
  auto l = listInput.placeholder("l", NodeMeta{std::vector<TensorMeta>{}});
  listInput.output({l});
  GraphLowering b(listInput, options_for(registry));
  EXPECT_THROW(b.run(), std::logic_error);

  Graph ok;
  auto x = ok.placeholder("x", f32({4}));
  ok.output({x});
  GraphLowering c(ok, options_for(registry));
  c.run();
  EXPECT_THROW(c.run(), std::logic_error);
  EXPECT_THROW(c.valueOf(memory::NodeId{7}), std::invalid_argument);
}

TEST(graph_lowering, OutputsKeepTheTracedStrideOrder) {
  LoweringRegistry registry;
  Graph graph;
  auto x = graph.placeholder("x", f32({2, 3}));
  auto r = graph.call(ops::aten("relu"), {x}, TensorMeta{{2, 3}, {1, 2}});
  graph.output({r});

  GraphLowering lowering(graph, options_for(registry));
  lowering.run();

  const IRGraph &ir = lowering.ir();
  const IRNodeId rt = lowering.valueOf(r).tensor();
  ASSERT_TRUE(ir.isRealized(rt));
  EXPECT_EQ(ir.layout(rt).strides, consts({1, 2}));
  EXPECT_EQ(ir.buffers().size(), 1u);
}

TEST(graph_lowering, AsStridedInputsKeepTheTracedStrideOrder) {
  LoweringRegistry registry;
  Graph graph;
  auto x = graph.placeholder("x", f32({2, 3}));
  auto r = graph.call(ops::aten("relu"), {x}, TensorMeta{{2, 3}, {1, 2}});
  auto a = graph.call(ops::aten("as_strided"),
                      {r, Argument::Ints({3, 2}), Argument::Ints({2, 1})},
                      f32({3, 2}));
  graph.output({a});

  GraphLowering lowering(graph, options_for(registry));
  lowering.run();

  const IRGraph &ir = lowering.ir();
  const IRNodeId rt = lowering.valueOf(r).tensor();
  ASSERT_TRUE(ir.isRealized(rt));
  EXPECT_EQ(ir.layout(rt).strides, consts({1, 2}));
  EXPECT_EQ(ir.render(lowering.valueOf(a).tensor()),
            "reinterpret_tensor(buf0, [3, 2], [2, 1], 0)");
}

TEST(graph_lowering, ChannelsLastOutputsWithLayoutOptimization) {
  LoweringRegistry registry;
  ConvRelu g;
  auto options = options_for(registry);
  options.layoutOpt = true;
  GraphLowering lowering(g.graph, options);
  lowering.run();

  EXPECT_TRUE(lowering.layoutOpt());
  EXPECT_TRUE(lowering.prefersChannelsLast(g.relu));
  EXPECT_EQ(lowering.numChannelsLastConv(), 1u);

  const IRGraph &ir = lowering.ir();
  const auto nhwc = consts({65536, 1, 4096, 256});
  EXPECT_EQ(ir.layout(lowering.valueOf(g.conv).tensor()).strides, nhwc);
  EXPECT_EQ(ir.layout(lowering.valueOf(g.relu).tensor()).strides, nhwc);
  // input and weight are copied to channels-last, then conv and relu
  EXPECT_EQ(ir.buffers().size(), 4u);
}

TEST(graph_lowering, UserVisibleOutputsStayContiguous) {
  LoweringRegistry registry;
  ConvRelu g;
  auto options = options_for(registry);
  options.layoutOpt = true;
  options.userVisibleOutputs.insert("relu");
  GraphLowering lowering(g.graph, options);
  lowering.run();

  const IRGraph &ir = lowering.ir();
  EXPECT_EQ(ir.layout(lowering.valueOf(g.conv).tensor()).strides,
            consts({65536, 1, 4096, 256}));
  EXPECT_EQ(ir.layout(lowering.valueOf(g.relu).tensor()).strides,
            consts({65536, 256, 16, 1}));
}

TEST(graph_lowering, WithoutLayoutOptimizationConvolutionsStayContiguous) {
  LoweringRegistry registry;
  ConvRelu g;
  auto options = options_for(registry);
  options.layoutOpt = false;
  GraphLowering lowering(g.graph, options);
  lowering.run();

  EXPECT_FALSE(lowering.prefersChannelsLast(g.relu));
  EXPECT_EQ(lowering.numChannelsLastConv(), 0u);
  const IRGraph &ir = lowering.ir();
  const auto contiguous = consts({65536, 256, 16, 1});
  EXPECT_EQ(ir.layout(lowering.valueOf(g.conv).tensor()).strides, contiguous);
  EXPECT_EQ(ir.layout(lowering.valueOf(g.relu).tensor()).strides, contiguous);
  EXPECT_EQ(ir.buffers().size(), 2u);
}

TEST(graph_lowering, SharedInputsOfMemoryReadingOpsAreRealized) {
  LoweringRegistry registry;
  const OpOverload consume = ops::aten("consume");
  registry.registerLowering(consume, returns_first_arg());
  registry.addNeedsRealizedInputs(consume);

  Graph graph;
  auto x = graph.placeholder("x", f32({8}));
  auto y = graph.placeholder("y", f32({8}));
  // two buffers read
  auto p = graph.call(ops::aten("add", "Tensor"), {x, y}, f32({8}));
  graph.call(consume, {p}, f32({8}));
  auto a = graph.call(ops::aten("neg"), {p}, f32({8}));
  // one buffer read
  auto q = graph.call(ops::aten("relu"), {x}, f32({8}));
  graph.call(consume, {q}, f32({8}));
  auto b = graph.call(ops::aten("neg"), {q}, f32({8}));
  graph.output({a, b});

  GraphLowering lowering(graph, options_for(registry));
  lowering.run();

  const IRGraph &ir = lowering.ir();
  const IRNodeId pt = lowering.valueOf(p).tensor();
  ASSERT_TRUE(ir.isRealized(pt));
  EXPECT_EQ(ir.bufferName(pt), "buf0");
  EXPECT_FALSE(ir.isRealized(lowering.valueOf(q).tensor()));
  EXPECT_EQ(ir.render(ir[ir.dataOf(lowering.valueOf(a).tensor())].computed().data),
            "neg(buf0)");
  EXPECT_EQ(ir.render(ir[ir.dataOf(lowering.valueOf(b).tensor())].computed().data),
            "neg(relu(x))");
}

TEST(graph_lowering, MatmulInputsUseTheTracedStrideOrder) {
  LoweringRegistry registry;
  Graph graph;
  auto a = graph.placeholder("a", f32({4, 4}));
  auto b = graph.placeholder("b", f32({4, 4}));
  auto p = graph.call(ops::aten("relu"), {a}, TensorMeta{{4, 4}, {1, 4}});
  auto m = graph.call(ops::aten("mm"), {p, b}, f32({4, 4}));
  auto n = graph.call(ops::aten("neg"), {p}, TensorMeta{{4, 4}, {1, 4}});
  graph.output({m, n});

  GraphLowering lowering(graph, options_for(registry));
  lowering.run();

  const IRGraph &ir = lowering.ir();
  const IRNodeId pt = lowering.valueOf(p).tensor();
  ASSERT_TRUE(ir.isRealized(pt));
  EXPECT_EQ(ir.bufferName(pt), "buf0");
  EXPECT_EQ(ir.layout(pt).strides, consts({1, 4}));
}

TEST(graph_lowering, ConvolutionInputsFollowTheLayoutDecision) {
  LoweringRegistry registry;
  auto build = [](Graph &graph) {
    auto x = graph.placeholder("x", f32({1, 128, 16, 16}));
    auto y = graph.placeholder("y", f32({1, 128, 16, 16}));
    auto w = graph.placeholder("w", f32({256, 128, 3, 3}));
    auto p = graph.call(ops::aten("add", "Tensor"), {x, y},
                        f32({1, 128, 16, 16}));
    auto c = graph.call(ops::aten("convolution"), conv_args(p, w),
                        f32({1, 256, 16, 16}));
    auto n = graph.call(ops::aten("neg"), {p}, f32({1, 128, 16, 16}));
    graph.output({c, n});
    return std::make_pair(p, c);
  };

  {
    // the traced order is required up front
    Graph graph;
    const auto [p, c] = build(graph);
    auto options = options_for(registry);
    options.layoutOpt = false;
    GraphLowering lowering(graph, options);
    lowering.run();

    const IRGraph &ir = lowering.ir();
    const IRNodeId pt = lowering.valueOf(p).tensor();
    ASSERT_TRUE(ir.isRealized(pt));
    EXPECT_EQ(ir.layout(pt).strides, consts({32768, 256, 16, 1}));
  }
  {
    // the convolution picks channels-last without copying its input
    Graph graph;
    const auto [p, c] = build(graph);
    auto options = options_for(registry);
    options.layoutOpt = true;
    GraphLowering lowering(graph, options);
    lowering.run();

    const IRGraph &ir = lowering.ir();
    const IRNodeId pt = lowering.valueOf(p).tensor();
    ASSERT_TRUE(ir.isRealized(pt));
    EXPECT_EQ(ir.bufferName(pt), "buf0");
    EXPECT_EQ(ir.layout(pt).strides, consts({32768, 1, 2048, 128}));
    const IRNode &conv = ir[ir.dataOf(lowering.valueOf(c).tensor())];
    ASSERT_EQ(conv.tag(), IRNodeKind::ExternKernel);
    EXPECT_EQ(conv.externKernel().inputs[0], ir.dataOf(pt));
  }
}

TEST(graph_lowering, DeviceTypesAndIndices) {
  LoweringRegistry registry;
  Graph graph;
  auto x = graph.placeholder("x", f32({4}, Device::cuda(0)));
  auto y = graph.placeholder("y", f32({4}, Device::cuda(1)));
  auto r = graph.call(ops::aten("relu"), {y}, f32({4}, Device::cuda(1)));
  graph.output({x, r});

  GraphLowering lowering(graph, options_for(registry));
  lowering.run();

  EXPECT_EQ(lowering.deviceTypes(),
            (memory::hash_set<DeviceType>{DeviceType::CUDA}));
  EXPECT_EQ(lowering.deviceIdxs(), (memory::hash_set<std::int32_t>{0, 1}));

  Graph cpu;
  auto z = cpu.placeholder("z", f32({4}));
  cpu.output({cpu.call(ops::aten("neg"), {z}, f32({4}))});
  GraphLowering host(cpu, options_for(registry));
  host.run();
  EXPECT_EQ(host.deviceTypes(),
            (memory::hash_set<DeviceType>{DeviceType::CPU}));
  EXPECT_TRUE(host.deviceIdxs().empty());
}
