#include "lowir/compiler/ir/IRGraph.hpp"
#include "lowir/diag/invalid_argument.hpp"
#include "lowir/diag/logging.hpp"
#include <fmt/format.h>

namespace lowir::compiler {

void IRGraph::freezeLayout(IRNodeId tensor) {
  if (isView(tensor)) {
    return;
  }
  const IRNodeId buffer = realize(tensor);
  Layout &layout = at(buffer).layout();
  if (layout.isFlexible()) {
    layout = layout.asFixed();
  }
}

bool IRGraph::isStrideOrdered(const Layout &layout,
                              memory::span<const std::size_t> order) const {
  if (order.size() != layout.strides.size()) {
    return false;
  }
  const auto sizes = m_env->hints(layout.sizes);
  const auto strides = m_env->hints(layout.strides);
  std::int64_t previous = -1;
  for (std::size_t d : stride_order_to_fill_order(order)) {
    // extent-1 dimensions do not constrain the order
    if (sizes[d] <= 1) {
      continue;
    }
    if (strides[d] < previous) {
      return false;
    }
    previous = strides[d];
  }
  return true;
}

IRNodeId IRGraph::copyInto(IRNodeId src, Layout layout) {
  Pointwise copy{
      .device = device(src),
      .dtype = dtype(src),
      .ranges = sizes(src),
      .fn = "copy",
      .inputs = {operand(src)},
      .scalars = {},
  };
  const memory::optional<memory::NodeId> origin = (*this)[dataOf(src)].origin;
  IRNodeId data = create(std::move(copy));
  at(data).origin = origin;
  IRNodeId buffer = create(ComputedBuffer{
      .name = {},
      .layout = std::move(layout),
      .data = data,
  });
  at(buffer).origin = origin;
  registerBuffer(buffer);
  return create(StorageBox{buffer});
}

IRNodeId IRGraph::requireStrideOrder(IRNodeId tensor,
                                     memory::span<const std::size_t> order) {
  const auto sz = sizes(tensor);
  if (order.size() != sz.size()) {
    diag::invalid_argument(fmt::format(
        "stride order of rank {} requested for a rank {} tensor",
        order.size(), sz.size()));
  }
  if (!isView(tensor)) {
    if (isLoops(tensor)) {
      realize(tensor);
    }
    Layout &layout = at(dataOf(tensor)).layout();
    if (layout.isFlexible()) {
      layout.strides = Layout::strideOrdered(layout.sizes, order, *m_env);
      layout.kind = LayoutKind::Fixed;
      return tensor;
    }
  }
  const Layout &current = layout(tensor);
  if (current.kind != LayoutKind::MultiOutput &&
      isStrideOrdered(current, order)) {
    return tensor;
  }
  LOWIR_DEBUG("copying {} to satisfy a required stride order", tensor);
  Layout target = Layout::fixed(device(tensor), dtype(tensor), sz,
                                Layout::strideOrdered(sz, order, *m_env));
  return copyInto(tensor, std::move(target));
}

IRNodeId IRGraph::reinterpret(IRNodeId tensor, memory::vector<Sym> sizes,
                              memory::vector<Sym> strides, Sym offset) {
  const IRNodeId storage = storageOf(tensor);
  freezeLayout(storage);
  const Layout &base = layout(storage);
  Layout layout = Layout::fixed(base.device, base.dtype, std::move(sizes),
                                std::move(strides), offset);
  return create(ReinterpretView{
      .data = storage,
      .layout = std::move(layout),
  });
}

void IRGraph::decideLayout(IRNodeId buffer) {
  IRNode &node = at(buffer);
  if (!node.isBuffer()) {
    diag::invalid_argument(fmt::format("{} is not a buffer", buffer));
  }
  Layout &layout = node.layout();
  if (layout.isFlexible()) {
    layout = layout.asFixed();
  }
}

} // namespace lowir::compiler
