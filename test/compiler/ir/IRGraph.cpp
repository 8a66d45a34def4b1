#include "lowir/compiler/ir/IRGraph.hpp"
#include "lowir/compiler/ir/stride_order.hpp"
#include <gtest/gtest.h>
#include <initializer_list>
#include <stdexcept>

using namespace lowir;
using namespace lowir::compiler;

namespace {

memory::vector<Sym> consts(std::initializer_list<std::int64_t> values) {
  memory::vector<Sym> out;
  for (std::int64_t v : values) {
    out.push_back(Sym::Const(v));
  }
  return out;
}

IRNodeId input(IRGraph &ir, memory::string name,
               std::initializer_list<std::int64_t> sizes) {
  memory::vector<Sym> s = consts(sizes);
  memory::vector<Sym> strides = Layout::contiguousStrides(s, ir.shapeEnv());
  return ir.box(InputBuffer{
      .name = std::move(name),
      .layout = Layout::fixed(Device::cpu(), TensorDataType::Float32,
                              std::move(s), std::move(strides)),
  });
}

IRNodeId pointwise(IRGraph &ir, memory::string fn,
                   std::initializer_list<IRNodeId> operands) {
  memory::vector<IRNodeId> inputs;
  for (IRNodeId t : operands) {
    inputs.push_back(ir.operand(t));
  }
  return ir.box(Pointwise{
      .device = Device::cpu(),
      .dtype = TensorDataType::Float32,
      .ranges = ir.sizes(*operands.begin()),
      .fn = std::move(fn),
      .inputs = std::move(inputs),
      .scalars = {},
  });
}

} // namespace

TEST(ir_graph, RealizeNamesBuffersInOrder) {
  ShapeEnv env;
  IRGraph ir(env);
  auto x = input(ir, "x", {8});
  auto a = pointwise(ir, "relu", {x});
  auto b = pointwise(ir, "neg", {x});

  EXPECT_TRUE(ir.isRealized(x));
  EXPECT_FALSE(ir.isRealized(a));
  EXPECT_TRUE(ir.isLoops(a));

  const IRNodeId bufB = ir.realize(b);
  const IRNodeId bufA = ir.realize(a);
  EXPECT_EQ(ir.bufferName(b), "buf0");
  EXPECT_EQ(ir.bufferName(a), "buf1");
  EXPECT_EQ(ir.realize(a), bufA);
  EXPECT_EQ(ir.buffers(), (memory::vector<IRNodeId>{bufB, bufA}));
  EXPECT_EQ(ir.bufferByName("buf1"), bufA);
  EXPECT_FALSE(ir.bufferByName("x").has_value());

  EXPECT_EQ(ir.layout(a).kind, LayoutKind::Flexible);
  EXPECT_EQ(ir.layout(a).strides, consts({1}));
  ir.freezeLayout(a);
  EXPECT_EQ(ir.layout(a).kind, LayoutKind::Fixed);
}

TEST(ir_graph, ReadsLookThroughUnrealizedProducers) {
  ShapeEnv env;
  IRGraph ir(env);
  auto x = input(ir, "x", {4});
  auto y = input(ir, "y", {4});
  auto sum = pointwise(ir, "add", {x, y});
  auto r = pointwise(ir, "relu", {sum});

  EXPECT_EQ(ir.readBuffers(r),
            (memory::vector<IRNodeId>{ir.dataOf(x), ir.dataOf(y)}));
  EXPECT_EQ(ir.numReads(r), 2u);
  EXPECT_EQ(ir.render(r), "relu(add(x, y))");

  // existing readers keep their inlined operand, new ones load the buffer
  ir.realize(sum);
  EXPECT_EQ(ir.numReads(r), 2u);
  auto n = pointwise(ir, "neg", {sum});
  EXPECT_EQ(ir.readBuffers(n), (memory::vector<IRNodeId>{ir.dataOf(sum)}));
  EXPECT_EQ(ir.render(n), "neg(buf0)");
}

TEST(ir_graph, RealizeHintNeedsSeveralReads) {
  ShapeEnv env;
  IRGraph ir(env);
  auto x = input(ir, "x", {4});
  auto y = input(ir, "y", {4});
  auto single = pointwise(ir, "relu", {x});
  auto pair = pointwise(ir, "add", {x, y});

  ir.realizeHint(single);
  ir.realizeHint(pair);
  EXPECT_FALSE(ir.isRealized(single));
  EXPECT_TRUE(ir.isRealized(pair));
}

TEST(ir_graph, ReuseThresholds) {
  ShapeEnv env;
  IRGraph ir(env);
  RealizeThresholds thresholds;
  thresholds.realizeReadsThreshold = 1;
  auto x = input(ir, "x", {4});
  auto y = input(ir, "y", {4});
  auto cheap = pointwise(ir, "relu", {x});
  auto wide = pointwise(ir, "add", {x, y});
  auto heavy = pointwise(ir, "exp", {x});

  ir.markReuse(cheap, 2, thresholds);
  ir.markReuse(wide, 1, thresholds);
  EXPECT_FALSE(ir.isRealized(cheap));
  EXPECT_FALSE(ir.isRealized(wide));
  ir.markReuse(wide, 2, thresholds);
  ir.markReuse(heavy, 2, thresholds);
  EXPECT_TRUE(ir.isRealized(wide));
  EXPECT_TRUE(ir.isRealized(heavy));

  thresholds.realizeAccReadsThreshold = 1;
  auto acc = pointwise(ir, "mul", {x, y});
  EXPECT_TRUE(ir.hasExceededMaxReads(acc, thresholds));
  EXPECT_FALSE(ir.hasExceededMaxReads(cheap, thresholds));
}

TEST(ir_graph, RequireStrideOrder) {
  ShapeEnv env;
  IRGraph ir(env);
  auto x = input(ir, "x", {2, 3, 4, 5});
  auto r = pointwise(ir, "relu", {x});

  const IRNodeId nhwc = ir.requireStrideOrder(r, nhwc_stride_order());
  EXPECT_EQ(nhwc, r);
  EXPECT_EQ(ir.layout(r).kind, LayoutKind::Fixed);
  EXPECT_EQ(ir.layout(r).strides, consts({60, 1, 15, 3}));
  EXPECT_TRUE(ir.isStrideOrdered(ir.layout(r), nhwc_stride_order()));

  // a fixed layout cannot be restrided, the data is copied instead
  const StrideOrder contiguous{3, 2, 1, 0};
  const IRNodeId copy = ir.requireStrideOrder(r, contiguous);
  EXPECT_NE(copy, r);
  EXPECT_EQ(ir.layout(copy).strides, consts({60, 20, 5, 1}));
  EXPECT_EQ(ir.bufferName(copy), "buf1");
  EXPECT_EQ(ir.render(ir.dataOf(copy)), "buf1");
  EXPECT_EQ(ir.readBuffers(copy), (memory::vector<IRNodeId>{ir.dataOf(r)}));

  // already satisfied
  EXPECT_EQ(ir.requireStrideOrder(x, contiguous), x);
  EXPECT_THROW(ir.requireStrideOrder(x, StrideOrder{0, 1}),
               std::invalid_argument);
}

TEST(ir_graph, ReinterpretAliasesStorage) {
  ShapeEnv env;
  IRGraph ir(env);
  auto x = input(ir, "x", {2, 6});
  auto r = pointwise(ir, "relu", {x});
  auto v = ir.reinterpret(r, consts({6, 2}), consts({1, 6}));

  EXPECT_TRUE(ir.isView(v));
  EXPECT_TRUE(ir.isRealized(r));
  EXPECT_EQ(ir.layout(r).kind, LayoutKind::Fixed);
  EXPECT_EQ(ir.storageOf(v), r);
  EXPECT_EQ(ir.sizes(v), consts({6, 2}));
  EXPECT_EQ(ir.numReads(v), 1u);
  EXPECT_EQ(ir.render(v), "reinterpret_tensor(buf0, [6, 2], [1, 6], 0)");
}

TEST(ir_graph, CapturedViewsKeepTheirBuffer) {
  ShapeEnv env;
  IRGraph ir(env);
  auto x = input(ir, "x", {4});
  auto r = pointwise(ir, "relu", {x});
  auto v = ir.reinterpret(r, consts({2, 2}), consts({2, 1}));
  auto n = pointwise(ir, "neg", {v});
  const IRNodeId before = ir.dataOf(r);

  // rebind the box behind the view to a new buffer
  auto e = pointwise(ir, "exp", {x});
  const IRNodeId other = ir.realize(e);
  ir.at(ir.storageOf(r)).storage().data = other;

  EXPECT_EQ(ir.render(v), "reinterpret_tensor(buf1, [2, 2], [2, 1], 0)");
  EXPECT_EQ(ir.render(n), "neg(reinterpret_tensor(buf0, [2, 2], [2, 1], 0))");
  EXPECT_EQ(ir.readBuffers(n), (memory::vector<IRNodeId>{before}));
  EXPECT_EQ(ir.readBuffers(v), (memory::vector<IRNodeId>{ir.dataOf(r)}));
  EXPECT_EQ(ir.storageOf(v), ir.storageOf(r));
}

TEST(ir_graph, InvalidHandles) {
  ShapeEnv env;
  IRGraph ir(env);
  auto x = input(ir, "x", {4});
  auto r = pointwise(ir, "relu", {x});

  EXPECT_THROW(ir[IRNodeId{99}], std::invalid_argument);
  EXPECT_THROW(ir.storageOf(ir.dataOf(r)), std::invalid_argument);
  EXPECT_THROW(ir.layout(r), std::invalid_argument);
  EXPECT_THROW(ir.bufferName(r), std::invalid_argument);
  EXPECT_THROW(ir.decideLayout(ir.dataOf(r)), std::invalid_argument);
}
