#include "lowir/compiler/GraphLowering.hpp"
#include "lowir/compiler/ir/stride_order.hpp"
#include "lowir/compiler/lowering/LoweringRegistry.hpp"
#include "lowir/diag/logging.hpp"
#include <algorithm>
#include <array>

namespace lowir::compiler {

namespace {

bool is_as_strided(const Node &node) {
  static const std::array<OpOverload, 3> asStrided{
      ops::aten("as_strided"),
      ops::aten("as_strided_"),
      ops::aten("as_strided_scatter"),
  };
  return node.isCall() &&
         std::find(asStrided.begin(), asStrided.end(), node.target) !=
             asStrided.end();
}

} // namespace

bool GraphLowering::isSymbolicScalarOp(const OpOverload &op) const {
  if (op.ns == "aten") {
    return op.name == "sym_size" || op.name == "sym_stride" ||
           op.name == "sym_numel";
  }
  if (op.ns != "operator") {
    return false;
  }
  static const memory::hash_set<memory::string> magicMethods{
      "add", "sub", "mul", "floordiv", "truediv", "mod", "pow", "neg",
      "eq",  "ne",  "lt",  "le",       "gt",      "ge",  "and_", "or_",
  };
  return magicMethods.contains(op.name);
}

bool GraphLowering::needsFixedLayout(const OpOverload &op) const {
  static const memory::hash_set<memory::string> always{
      "aten::convolution_backward.default",
      "aten::mm.default",
      "aten::_int_mm.default",
  };
  static const memory::hash_set<memory::string> mkldnn{
      "mkldnn::_convolution_pointwise.default",
      "mkldnn::_convolution_pointwise.binary",
      "mkldnn::_convolution_pointwise_.binary",
      "mkldnn::_convolution_transpose_pointwise.default",
      "mkldnn::_linear_pointwise.default",
      "mkldnn::_linear_pointwise.binary",
      "aten::mkldnn_rnn_layer.default",
      "onednn::qconv2d_pointwise.default",
      "onednn::qconv2d_pointwise.binary",
      "onednn::qlinear_pointwise.default",
  };
  const memory::string name = op.fullName();
  if (always.contains(name)) {
    return true;
  }
  if (!m_layoutOpt && name == "aten::convolution.default") {
    return true;
  }
  const RuntimeInfo &runtime = m_options.runtime;
  if (runtime.mkldnnAvailable) {
    if (mkldnn.contains(name)) {
      return true;
    }
    if (runtime.mklAvailable && name == "mkl::_mkl_linear.default") {
      return true;
    }
  }
  return false;
}

Value GraphLowering::enforceStrideOrder(const Node &node, Value result) {
  if (!result.isTensor() || !node.meta.isTensor()) {
    return result;
  }
  bool isOutput = false;
  bool feedsAsStrided = false;
  for (memory::NodeId u : node.users) {
    const Node &user = (*m_graph)[u];
    isOutput = isOutput || user.kind == NodeKind::Output;
    feedsAsStrided = feedsAsStrided || is_as_strided(user);
  }
  if (!isOutput && !feedsAsStrided) {
    return result;
  }
  const TensorMeta &example = node.meta.tensor();
  const IRNodeId tensor = result.tensor();
  const std::size_t rank = m_ir.sizes(tensor).size();
  // a stride order cannot recreate the strides of a non-dense example
  if (example.strides.empty() || !example.isNonOverlappingAndDense() ||
      example.dim() != rank) {
    return result;
  }
  StrideOrder order = get_stride_order(example.strides);
  if (rank == 4 && prefersChannelsLast(node.id) &&
      !m_options.userVisibleOutputs.contains(node.name) && !feedsAsStrided) {
    order = nhwc_stride_order();
  }
  return m_ir.requireStrideOrder(tensor, order);
}

Value GraphLowering::applyRealizationPolicy(const Node &node, Value result) {
  if (!result.isTensor()) {
    return result;
  }
  IRNodeId tensor = result.tensor();
  const std::size_t numUsers = node.users.size();
  if (numUsers > 1) {
    for (memory::NodeId u : node.users) {
      const Node &user = (*m_graph)[u];
      if (user.isCall() && m_registry->needsRealizedInputs(user.target)) {
        m_ir.realizeHint(tensor);
        if (needsFixedLayout(user.target) && node.meta.isTensor() &&
            node.meta.tensor().dim() == m_ir.sizes(tensor).size()) {
          tensor = m_ir.requireStrideOrder(
              tensor, get_stride_order(node.meta.tensor().strides));
        }
      }
      if (user.kind == NodeKind::Output && !m_ir.isView(tensor) &&
          m_ir.isLoops(tensor)) {
        m_ir.realize(tensor);
      }
    }
    m_ir.markReuse(tensor, numUsers, m_options.realize);
  }

  // keep computed buffers from accumulating reads across converging branches
  if (m_ir.hasExceededMaxReads(tensor, m_options.realize)) {
    m_ir.realizeHint(tensor);
  }
  return tensor;
}

void GraphLowering::tagOrigin(const Node &node, const Value &result) {
  if (!result.isTensor() || m_ir.isView(result.tensor())) {
    return;
  }
  const IRNodeId data = m_ir.dataOf(result.tensor());
  IRNode &irNode = m_ir.at(data);
  irNode.origin = node.id;
  if (irNode.tag() == IRNodeKind::ComputedBuffer) {
    const IRNodeId inner = irNode.computed().data;
    if (m_ir[inner].isLoops()) {
      m_ir.at(inner).origin = node.id;
    }
  } else if (irNode.tag() == IRNodeKind::MultiOutput &&
             irNode.multiOutput().indices.empty()) {
    const IRNodeId kernel = irNode.multiOutput().kernel;
    m_ir.at(kernel).origin = node.id;
  }
}

} // namespace lowir::compiler
