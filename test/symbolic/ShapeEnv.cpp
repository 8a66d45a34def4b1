#include "lowir/symbolic/ShapeEnv.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using namespace lowir;

TEST(symbolic_shape_env, DuckShaping_SameValueSameSymbol) {
  ShapeEnv env;
  Sym a = env.createSymbol(4, "x.size()[0]");
  Sym b = env.createSymbol(4, "y.size()[1]");
  Sym c = env.createSymbol(8, "x.size()[1]");

  EXPECT_TRUE(a.isSymbolic());
  EXPECT_EQ(a, b);
  EXPECT_FALSE(a == c);
  EXPECT_EQ(env.symbolCount(), 2u);
  // provenance is the first request
  EXPECT_EQ(env.source(b), "x.size()[0]");
}

TEST(symbolic_shape_env, ZeroAndOneAreNeverSymbolic) {
  ShapeEnv env;
  EXPECT_EQ(env.createSymbol(0, "x.size()[0]"), Sym::Const(0));
  EXPECT_EQ(env.createSymbol(1, "x.size()[1]"), Sym::Const(1));
  EXPECT_EQ(env.symbolCount(), 0u);
}

TEST(symbolic_shape_env, WithoutDuckShaping_FreshSymbols) {
  ShapeEnv env{false};
  Sym a = env.createSymbol(4, "x.size()[0]");
  Sym b = env.createSymbol(4, "y.size()[0]");
  EXPECT_FALSE(a == b);
  EXPECT_EQ(env.hint(a), env.hint(b));
  EXPECT_EQ(env.symbolCount(), 2u);
}

TEST(symbolic_shape_env, NegativeExampleValue) {
  ShapeEnv env;
  EXPECT_THROW(env.createSymbol(-3, "x.size()[0]"), std::invalid_argument);
}

TEST(symbolic_shape_env, LeafNames) {
  ShapeEnv env;
  Sym s0 = env.createSymbol(4, "a");
  Sym s1 = env.createSymbol(8, "b");
  EXPECT_EQ(env.to_string(s0), "s0");
  EXPECT_EQ(env.to_string(s1), "s1");
  EXPECT_EQ(env.to_string(env.add(s0, s1)), "s0 + s1");
  EXPECT_EQ(env.to_string(env.mul(s0, s1)), "s0*s1");
  EXPECT_EQ(env.to_string(Sym::Const(7)), "7");
  EXPECT_TRUE(env.isLeaf(s0));
  EXPECT_FALSE(env.isLeaf(env.add(s0, s1)));
}

TEST(symbolic_shape_env, HashConsing) {
  ShapeEnv env;
  Sym x = env.createSymbol(4, "x");
  Sym y = env.createSymbol(8, "y");

  EXPECT_EQ(env.add(x, y), env.add(y, x));
  EXPECT_EQ(env.mul(x, y), env.mul(y, x));
  EXPECT_EQ(env.add(env.add(x, Sym::Const(2)), Sym::Const(3)),
            env.add(x, Sym::Const(5)));
  EXPECT_EQ(env.mul(x, Sym::Const(1)), x);
  EXPECT_EQ(env.mul(x, Sym::Const(0)), Sym::Const(0));
  EXPECT_EQ(env.sub(x, x), Sym::Const(0));
  EXPECT_EQ(env.floordiv(env.mul(x, Sym::Const(3)), Sym::Const(3)), x);
}

TEST(symbolic_shape_env, Hints) {
  ShapeEnv env;
  Sym x = env.createSymbol(6, "x");
  Sym y = env.createSymbol(4, "y");

  EXPECT_EQ(env.hint(env.mul(x, y)), 24);
  EXPECT_EQ(env.hint(env.sub(y, x)), -2);
  EXPECT_EQ(env.hint(env.floordiv(x, y)), 1);

  std::vector<Sym> syms{x, y, Sym::Const(3)};
  auto hints = env.hints(syms);
  ASSERT_EQ(hints.size(), 3u);
  EXPECT_EQ(hints[0], 6);
  EXPECT_EQ(hints[1], 4);
  EXPECT_EQ(hints[2], 3);
}

TEST(symbolic_shape_env, ConstantFolding) {
  ShapeEnv env;
  EXPECT_EQ(env.add(Sym::Const(2), Sym::Const(3)), Sym::Const(5));
  EXPECT_EQ(env.floordiv(Sym::Const(7), Sym::Const(2)), Sym::Const(3));
  EXPECT_EQ(env.floordiv(Sym::Const(-7), Sym::Const(2)), Sym::Const(-4));
  EXPECT_THROW(env.floordiv(Sym::Const(7), Sym::Const(0)),
               std::invalid_argument);
}

TEST(symbolic_shape_env, DivisorWithZeroHint) {
  ShapeEnv env{false};
  Sym x = env.createSymbol(8, "x");
  Sym a = env.createSymbol(4, "a");
  Sym b = env.createSymbol(4, "b");
  Sym d = env.sub(a, b);
  ASSERT_TRUE(d.isSymbolic());
  EXPECT_EQ(env.hint(d), 0);

  EXPECT_THROW(env.floordiv(x, d), std::invalid_argument);
  EXPECT_THROW(env.floordiv(x, d), std::invalid_argument);
  EXPECT_EQ(env.hint(env.floordiv(x, a)), 2);
}

TEST(symbolic_shape_env, Product) {
  ShapeEnv env;
  Sym x = env.createSymbol(4, "x");
  std::vector<Sym> factors{x, Sym::Const(2), Sym::Const(3)};
  Sym p = env.product(factors);
  EXPECT_EQ(p, env.mul(x, Sym::Const(6)));
  EXPECT_EQ(env.hint(p), 24);
  EXPECT_EQ(env.product({}), Sym::Const(1));
}

TEST(symbolic_shape_env, PoolOutputExtent) {
  ShapeEnv env;
  // 32 wide input, 3x3 window, padding 1, stride 2 -> 16
  EXPECT_EQ(env.pool(Sym::Const(32), 3, 1, 2), Sym::Const(16));

  Sym x = env.createSymbol(32, "x");
  Sym out = env.pool(x, 3, 1, 1);
  EXPECT_EQ(out, x);
  EXPECT_EQ(env.hint(env.pool(x, 3, 1, 2)), 16);
  EXPECT_THROW(env.pool(x, 3, 1, 0), std::invalid_argument);
}
