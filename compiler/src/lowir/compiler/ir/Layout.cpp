#include "lowir/compiler/ir/Layout.hpp"
#include "lowir/diag/precondition.hpp"

namespace lowir::compiler {

memory::vector<Sym> Layout::contiguousStrides(memory::span<const Sym> sizes,
                                              ShapeEnv &env) {
  memory::vector<Sym> strides(sizes.size(), Sym::Const(1));
  Sym acc = Sym::Const(1);
  for (std::size_t i = sizes.size(); i-- > 0;) {
    strides[i] = acc;
    acc = env.mul(acc, sizes[i]);
  }
  return strides;
}

memory::vector<Sym> Layout::strideOrdered(memory::span<const Sym> sizes,
                                          memory::span<const std::size_t> order,
                                          ShapeEnv &env) {
  diag::precondition(order.size() == sizes.size() &&
                         is_permutation_order(order),
                     "stride order of rank {} does not match rank {}",
                     order.size(), sizes.size());
  memory::vector<Sym> strides(sizes.size(), Sym::Const(1));
  Sym next = Sym::Const(1);
  for (std::size_t d : stride_order_to_fill_order(order)) {
    strides[d] = next;
    next = env.mul(next, sizes[d]);
  }
  return strides;
}

Layout Layout::flexible(Device device, TensorDataType dtype,
                        memory::vector<Sym> sizes, ShapeEnv &env) {
  Layout l;
  l.kind = LayoutKind::Flexible;
  l.device = std::move(device);
  l.dtype = dtype;
  l.strides = contiguousStrides(sizes, env);
  l.sizes = std::move(sizes);
  return l;
}

Layout Layout::fixed(Device device, TensorDataType dtype,
                     memory::vector<Sym> sizes, memory::vector<Sym> strides,
                     Sym offset) {
  diag::precondition(sizes.size() == strides.size(),
                     "layout rank mismatch: {} sizes vs {} strides",
                     sizes.size(), strides.size());
  Layout l;
  l.kind = LayoutKind::Fixed;
  l.device = std::move(device);
  l.dtype = dtype;
  l.sizes = std::move(sizes);
  l.strides = std::move(strides);
  l.offset = offset;
  return l;
}

Layout Layout::mutation(IRNodeId target, const Layout &targetLayout) {
  Layout l = targetLayout;
  l.kind = LayoutKind::Mutation;
  l.target = target;
  return l;
}

Layout Layout::multiOutput(Device device) {
  Layout l;
  l.kind = LayoutKind::MultiOutput;
  l.device = std::move(device);
  return l;
}

} // namespace lowir::compiler
