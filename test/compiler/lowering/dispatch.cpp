#include "compiler/lowering_fixtures.hpp"
#include "lowir/compiler/lowering/constraints.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

using namespace lowir;
using namespace lowir::compiler;
using namespace lowir::compiler::fixtures;

namespace {

// x -> op(x) -> output
struct UnaryGraph {
  Graph graph;
  memory::NodeId x;
  memory::NodeId call;

  explicit UnaryGraph(OpOverload op) {
    x = graph.placeholder("x", f32({4}));
    call = graph.call(std::move(op), {x}, f32({4}));
    graph.output({call});
  }
};

} // namespace

TEST(lowering_dispatch, MissingOperatorWithoutDecomposition) {
  LoweringRegistry registry{false};
  auto options = options_for(registry);
  options.implicitFallbacks = false;
  UnaryGraph g(ops::aten("frobnicate"));

  GraphLowering lowering(g.graph, options);
  try {
    lowering.run();
    FAIL() << "expected MissingOperatorWithoutDecomp";
  } catch (const MissingOperatorWithoutDecomp &e) {
    EXPECT_EQ(e.op(), ops::aten("frobnicate"));
  }
  EXPECT_FALSE(registry.contains(ops::aten("frobnicate")));
}

TEST(lowering_dispatch, MissingOperatorWithDecomposition) {
  LoweringRegistry registry{false};
  registry.registerDecomposition(ops::aten("frobnicate", ""));
  auto options = options_for(registry);
  options.implicitFallbacks = false;
  UnaryGraph g(ops::aten("frobnicate"));

  GraphLowering lowering(g.graph, options);
  EXPECT_THROW(lowering.run(), MissingOperatorWithDecomp);
}

TEST(lowering_dispatch, ErrorsAreReturnedFromCallFunction) {
  LoweringRegistry registry{false};
  auto options = options_for(registry);
  options.implicitFallbacks = false;
  UnaryGraph g(ops::aten("frobnicate"));

  GraphLowering lowering(g.graph, options);
  LoweringResult result = lowering.callFunction(g.graph[g.call], {}, {});
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().tag(), LoweringErrorKind::MissingWithoutDecomp);
  EXPECT_EQ(result.error().op(), ops::aten("frobnicate"));
}

TEST(lowering_dispatch, ImplicitFallbackIsRegistered) {
  LoweringRegistry registry{false};
  UnaryGraph g(ops::aten("frobnicate"));

  GraphLowering lowering(g.graph, options_for(registry));
  lowering.run();

  EXPECT_TRUE(registry.isFallback(ops::aten("frobnicate")));
  EXPECT_TRUE(lowering.warnedFallbacks().contains("aten.frobnicate.default"));

  const IRGraph &ir = lowering.ir();
  ASSERT_EQ(ir.buffers().size(), 1u);
  const IRNode &kernel = ir[ir.buffers()[0]];
  ASSERT_EQ(kernel.tag(), IRNodeKind::ExternKernel);
  EXPECT_TRUE(kernel.externKernel().fallback);

  ASSERT_EQ(lowering.externKernelNodes().size(), 1u);
  const ExternKernelNode &record = lowering.externKernelNodes()[0];
  EXPECT_EQ(record.name, "buf0");
  EXPECT_EQ(record.kernel, "aten::frobnicate.default");
  EXPECT_EQ(record.inputs, (std::vector<std::string>{"x"}));
  EXPECT_EQ(record.outputs, (std::vector<std::string>{"buf0"}));

  // later lowerings find the fallback without implicit fallbacks
  auto strict = options_for(registry);
  strict.implicitFallbacks = false;
  GraphLowering second(g.graph, strict);
  EXPECT_NO_THROW(second.run());
}

TEST(lowering_dispatch, ImplicitFallbackWinsOverDecomposition) {
  LoweringRegistry registry{false};
  registry.registerDecomposition(ops::aten("frobnicate", ""));
  UnaryGraph g(ops::aten("frobnicate"));

  GraphLowering lowering(g.graph, options_for(registry));
  EXPECT_NO_THROW(lowering.run());
  EXPECT_TRUE(registry.isFallback(ops::aten("frobnicate")));
  EXPECT_TRUE(registry.hasDecomposition(ops::aten("frobnicate")));
  EXPECT_TRUE(lowering.warnedFallbacks().contains("aten.frobnicate.default"));

  const IRGraph &ir = lowering.ir();
  const IRNode &kernel = ir[ir.dataOf(lowering.valueOf(g.call).tensor())];
  ASSERT_EQ(kernel.tag(), IRNodeKind::ExternKernel);
  EXPECT_TRUE(kernel.externKernel().fallback);
}

TEST(lowering_dispatch, AllowListedOperatorsAlwaysFallBack) {
  LoweringRegistry registry{false};
  auto options = options_for(registry);
  options.implicitFallbacks = false;
  const OpOverload roiAlign = OpOverload::parse("torchvision::roi_align.default");
  UnaryGraph g(roiAlign);

  GraphLowering lowering(g.graph, options);
  EXPECT_NO_THROW(lowering.run());
  EXPECT_TRUE(registry.isFallback(roiAlign));
}

TEST(lowering_dispatch, HandlerExceptionsAreWrapped) {
  LoweringRegistry registry{false};
  registry.registerLowering(
      ops::aten("explode"),
      [](GraphLowering &, const Node &, memory::span<const Value>,
         const KwArgs &) -> Value { throw std::runtime_error("boom"); });
  UnaryGraph g(ops::aten("explode"));

  GraphLowering lowering(g.graph, options_for(registry));
  try {
    lowering.run();
    FAIL() << "expected LoweringException";
  } catch (const LoweringException &e) {
    EXPECT_EQ(e.op(), ops::aten("explode"));
    EXPECT_EQ(e.causeMessage(), "boom");
    EXPECT_NE(std::string(e.what()).find("target: aten::explode.default"),
              std::string::npos);
    EXPECT_THROW(e.rethrowCause(), std::runtime_error);
  }
}

TEST(lowering_dispatch, DirectLoweringBypassesRegistry) {
  LoweringRegistry registry{false};
  auto options = options_for(registry);
  options.implicitFallbacks = false;
  UnaryGraph g(ops::aten("frobnicate"));
  g.graph.setDirectLowering(g.call, returns_first_arg());

  GraphLowering lowering(g.graph, options);
  lowering.run();
  EXPECT_EQ(lowering.valueOf(g.call), lowering.valueOf(g.x));
  EXPECT_FALSE(registry.contains(ops::aten("frobnicate")));
  EXPECT_EQ(lowering.getOutputNames(), (std::vector<std::string>{"x"}));
}

TEST(lowering_dispatch, ComplexTensorsFallBackWithoutRegistration) {
  LoweringRegistry registry;
  Graph graph;
  auto meta = TensorMeta::contiguous({4}, TensorDataType::Complex64);
  auto x = graph.placeholder("x", meta);
  auto r = graph.call(ops::aten("relu"), {x}, meta);
  graph.output({r});

  GraphLowering lowering(graph, options_for(registry));
  lowering.run();

  const IRGraph &ir = lowering.ir();
  const IRNodeId data = ir.dataOf(lowering.valueOf(r).tensor());
  EXPECT_EQ(ir[data].tag(), IRNodeKind::ExternKernel);
  EXPECT_TRUE(lowering.warnedFallbacks().contains("aten.relu.default"));
  EXPECT_FALSE(registry.isFallback(ops::aten("relu")));
}

TEST(lowering_dispatch, GetitemSelectsMultiOutput) {
  LoweringRegistry registry{false};
  const OpOverload getitem{"operator", "getitem", ""};
  Graph graph;
  auto x = graph.placeholder("x", f32({4}));
  auto pair = graph.call(ops::aten("split_pair"), {x},
                         std::vector<TensorMeta>{f32({2}), f32({2})});
  auto second = graph.call(getitem, {pair, Argument::Int(1)}, f32({2}));
  auto last = graph.call(getitem, {pair, Argument::Int(-1)}, f32({2}));
  graph.output({second});

  GraphLowering lowering(graph, options_for(registry));
  lowering.run();

  const Value &outputs = lowering.valueOf(pair);
  ASSERT_EQ(outputs.tag(), ValueKind::List);
  ASSERT_EQ(outputs.list().size(), 2u);
  EXPECT_EQ(lowering.valueOf(second), outputs.list()[1]);
  EXPECT_EQ(lowering.valueOf(last), outputs.list()[1]);

  const IRGraph &ir = lowering.ir();
  EXPECT_EQ(ir.bufferName(lowering.valueOf(second).tensor()), "buf2");
  EXPECT_EQ(lowering.getOutputNames(), (std::vector<std::string>{"buf2"}));
  EXPECT_EQ(lowering.getNumel("buf0"), Sym::Const(1));
  EXPECT_EQ(lowering.getNumel("buf1"), Sym::Const(2));

  ASSERT_EQ(lowering.externKernelNodes().size(), 1u);
  EXPECT_EQ(lowering.externKernelNodes()[0].outputs,
            (std::vector<std::string>{"buf1", "buf2"}));
}

TEST(lowering_dispatch, SymbolicScalarsReuseTracedSymbols) {
  auto env = std::make_shared<ShapeEnv>();
  const Sym s = env->createSymbol(4, "x.size()[0]");

  // without a lowering for sym_size, dispatching would fail
  LoweringRegistry registry{false};
  auto options = options_for(registry);
  options.implicitFallbacks = false;

  Graph graph;
  auto x = graph.placeholder("x", dynamic_f32({4, 8}));
  auto size = graph.call(ops::aten("sym_size", "int"), {x, Argument::Int(0)},
                         NodeMeta{s});
  graph.output({x, size});

  GraphLowering lowering(graph, options, env);
  lowering.run();

  EXPECT_TRUE(lowering.reusesShapeEnv());
  EXPECT_EQ(lowering.valueOf(size).integer(), s);
  EXPECT_EQ(lowering.ir().sizes(lowering.valueOf(x).tensor())[0], s);
  EXPECT_EQ(lowering.getOutputNames(), (std::vector<std::string>{"x"}));
}

TEST(lowering_dispatch, SymbolicScalarsOfForeignEnvAreRecomputed) {
  ShapeEnv tracer;
  const Sym foreign = tracer.createSymbol(4, "x.size()[0]");

  LoweringRegistry registry;
  Graph graph;
  auto x = graph.placeholder("x", dynamic_f32({4, 8}));
  auto size = graph.call(ops::aten("sym_size", "int"), {x, Argument::Int(-1)},
                         NodeMeta{foreign});
  auto numel = graph.call(ops::aten("sym_numel"), {x}, NodeMeta{foreign});
  graph.output({x, size, numel});

  GraphLowering lowering(graph, options_for(registry));
  lowering.run();

  const auto sizes = lowering.ir().sizes(lowering.valueOf(x).tensor());
  EXPECT_EQ(lowering.valueOf(size).integer(), sizes[1]);
  EXPECT_EQ(lowering.valueOf(numel).integer(),
            lowering.shapeEnv().mul(sizes[0], sizes[1]));
}

TEST(lowering_dispatch, ScalarOperators) {
  LoweringRegistry registry;
  Graph graph;
  auto a = graph.placeholder("a", NodeMeta::Int(2));
  auto sum = graph.call(OpOverload{"operator", "add", ""},
                        {a, Argument::Int(3)}, NodeMeta::Int(5));
  auto prod = graph.call(OpOverload{"operator", "mul", ""},
                         {Argument::Float(1.5), a}, NodeMeta::Float(3.0));
  auto quot = graph.call(OpOverload{"operator", "floordiv", ""},
                         {Argument::Int(-7), a}, NodeMeta::Int(-4));
  graph.output({sum, prod, quot});

  GraphLowering lowering(graph, options_for(registry));
  lowering.run();

  EXPECT_EQ(lowering.valueOf(sum).integer(), Sym::Const(5));
  EXPECT_DOUBLE_EQ(lowering.valueOf(prod).floating(), 3.0);
  EXPECT_EQ(lowering.valueOf(quot).integer(), Sym::Const(-4));
  EXPECT_TRUE(lowering.getOutputNames().empty());
}

TEST(lowering_dispatch, LayoutConstraintRunsBeforeLowering) {
  LoweringRegistry registry;
  const OpOverload consume = ops::aten("consume");
  registry.registerLowering(consume, returns_first_arg());
  registry.addLayoutConstraint(consume, constrain_to_fx_strides);

  // column-major example value
  const TensorMeta transposed{{2, 3}, {1, 2}};
  Graph graph;
  auto x = graph.placeholder("x", f32({2, 3}));
  auto r = graph.call(ops::aten("relu"), {x}, transposed);
  auto c = graph.call(consume, {r}, transposed);
  graph.output({c});

  GraphLowering lowering(graph, options_for(registry));
  lowering.run();

  const IRGraph &ir = lowering.ir();
  const IRNodeId relu = lowering.valueOf(r).tensor();
  ASSERT_TRUE(ir.isRealized(relu));
  EXPECT_EQ(ir.layout(relu).strides,
            (std::vector<Sym>{Sym::Const(1), Sym::Const(2)}));
  EXPECT_EQ(lowering.valueOf(c), lowering.valueOf(r));
}
