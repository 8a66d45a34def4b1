#include "lowir/compiler/ir/IRNode.hpp"
#include "lowir/diag/invalid_state.hpp"

namespace lowir::compiler {

const memory::string &IRNode::bufferName() const {
  switch (tag()) {
  case IRNodeKind::ComputedBuffer:
    return computed().name;
  case IRNodeKind::InputBuffer:
    return input().name;
  case IRNodeKind::ConstantBuffer:
    return constant().name;
  case IRNodeKind::ExternKernel:
    return externKernel().name;
  case IRNodeKind::MultiOutput:
    return multiOutput().name;
  default:
    diag::invalid_state();
  }
}

const Layout &IRNode::layout() const {
  return const_cast<IRNode *>(this)->layout();
}

Layout &IRNode::layout() {
  switch (tag()) {
  case IRNodeKind::ComputedBuffer:
    return computed().layout;
  case IRNodeKind::InputBuffer:
    return std::get<InputBuffer>(m_var).layout;
  case IRNodeKind::ConstantBuffer:
    return std::get<ConstantBuffer>(m_var).layout;
  case IRNodeKind::ExternKernel:
    return externKernel().layout;
  case IRNodeKind::MultiOutput:
    return multiOutput().layout;
  case IRNodeKind::ReinterpretView:
    return std::get<ReinterpretView>(m_var).layout;
  default:
    diag::invalid_state();
  }
}

} // namespace lowir::compiler
