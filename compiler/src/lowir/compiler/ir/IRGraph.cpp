#include "lowir/compiler/ir/IRGraph.hpp"
#include "lowir/diag/invalid_argument.hpp"
#include "lowir/diag/invalid_state.hpp"
#include "lowir/diag/logging.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace lowir::compiler {

IRNodeId IRGraph::create(IRNode node) {
  IRNodeId id{m_nodes.size()};
  m_nodes.push_back(std::move(node));
  return id;
}

IRNodeId IRGraph::box(IRNode data) {
  IRNodeId d = create(std::move(data));
  return create(StorageBox{d});
}

const IRNode &IRGraph::operator[](IRNodeId id) const {
  if (!id || *id >= m_nodes.size()) {
    diag::invalid_argument(fmt::format("unknown ir node {}", id));
  }
  return m_nodes[*id];
}

IRNode &IRGraph::at(IRNodeId id) {
  if (!id || *id >= m_nodes.size()) {
    diag::invalid_argument(fmt::format("unknown ir node {}", id));
  }
  return m_nodes[*id];
}

IRNodeId IRGraph::storageOf(IRNodeId tensor) const {
  const IRNode &node = (*this)[tensor];
  switch (node.tag()) {
  case IRNodeKind::StorageBox:
    return tensor;
  case IRNodeKind::ReinterpretView:
    return storageOf(node.view().data);
  default:
    diag::invalid_argument(
        fmt::format("{} of kind {} is not a tensor handle", tensor, node.tag()));
  }
}

IRNodeId IRGraph::dataOf(IRNodeId tensor) const {
  return (*this)[storageOf(tensor)].storage().data;
}

bool IRGraph::isView(IRNodeId tensor) const {
  return (*this)[tensor].tag() == IRNodeKind::ReinterpretView;
}

bool IRGraph::isRealized(IRNodeId tensor) const {
  return (*this)[dataOf(tensor)].isBuffer();
}

bool IRGraph::isLoops(IRNodeId tensor) const {
  return (*this)[dataOf(tensor)].isLoops();
}

IRNodeId IRGraph::operand(IRNodeId tensor) {
  if (!isView(tensor)) {
    return dataOf(tensor);
  }
  ReinterpretView bound = (*this)[tensor].view();
  if (!bound.buffer) {
    bound.buffer = dataOf(bound.data);
  }
  return create(std::move(bound));
}

IRNodeId IRGraph::viewBuffer(IRNodeId view) const {
  const ReinterpretView &v = (*this)[view].view();
  if (v.buffer) {
    return v.buffer;
  }
  return dataOf(v.data);
}

memory::string IRGraph::registerBuffer(IRNodeId buffer) {
  IRNode &node = at(buffer);
  memory::string name = fmt::format("buf{}", m_buffers.size());
  switch (node.tag()) {
  case IRNodeKind::ComputedBuffer:
    node.computed().name = name;
    break;
  case IRNodeKind::ExternKernel:
    node.externKernel().name = name;
    break;
  case IRNodeKind::MultiOutput:
    node.multiOutput().name = name;
    break;
  default:
    diag::invalid_argument(
        fmt::format("cannot register {} as a buffer", node.tag()));
  }
  m_buffers.push_back(buffer);
  m_nameToBuffer.emplace(name, buffer);
  return name;
}

memory::optional<IRNodeId>
IRGraph::bufferByName(memory::string_view name) const {
  auto it = m_nameToBuffer.find(memory::string(name));
  if (it == m_nameToBuffer.end()) {
    return memory::nullopt;
  }
  return it->second;
}

IRNodeId IRGraph::realize(IRNodeId tensor) {
  const IRNodeId storage = storageOf(tensor);
  const IRNodeId data = (*this)[storage].storage().data;
  const IRNode &dataNode = (*this)[data];
  if (dataNode.isBuffer()) {
    return data;
  }
  if (!dataNode.isLoops()) {
    diag::invalid_state();
  }
  Layout layout;
  if (dataNode.tag() == IRNodeKind::Pointwise) {
    const auto &pw = dataNode.pointwise();
    layout = Layout::flexible(pw.device, pw.dtype, pw.ranges, *m_env);
  } else {
    const auto &red = dataNode.reduction();
    layout = Layout::flexible(red.device, red.dtype, red.ranges, *m_env);
  }
  memory::optional<memory::NodeId> origin = dataNode.origin;
  IRNodeId buffer = create(ComputedBuffer{
      .name = {},
      .layout = std::move(layout),
      .data = data,
  });
  at(buffer).origin = origin;
  const memory::string name = registerBuffer(buffer);
  at(storage).storage().data = buffer;
  LOWIR_TRACE("realized {} into {}", storage, name);
  return buffer;
}

void IRGraph::realizeHint(IRNodeId tensor) {
  if (isLoops(tensor) && numReads(tensor) > 1) {
    realize(tensor);
  }
}

bool IRGraph::computesFn(IRNodeId loops, memory::string_view fn) const {
  const IRNode &node = (*this)[loops];
  if (node.tag() != IRNodeKind::Pointwise) {
    return false;
  }
  const auto &pw = node.pointwise();
  if (pw.fn == fn) {
    return true;
  }
  return std::any_of(pw.inputs.begin(), pw.inputs.end(), [&](IRNodeId in) {
    return (*this)[in].isLoops() && computesFn(in, fn);
  });
}

void IRGraph::markReuse(IRNodeId tensor, std::size_t users,
                        const RealizeThresholds &thresholds) {
  if (users <= 1 || isView(tensor) || !isLoops(tensor)) {
    return;
  }
  bool heavy = false;
  if (device(tensor).isCpu()) {
    heavy = computesFn(dataOf(tensor), "exp");
  }
  if (heavy || static_cast<std::int64_t>(numReads(tensor)) >
                   thresholds.realizeReadsThreshold) {
    realize(tensor);
  }
}

bool IRGraph::hasExceededMaxReads(IRNodeId tensor,
                                  const RealizeThresholds &thresholds) const {
  if (isView(tensor)) {
    return false;
  }
  const IRNode &data = (*this)[dataOf(tensor)];
  return data.tag() == IRNodeKind::Pointwise &&
         static_cast<std::int64_t>(numReads(tensor)) >
             thresholds.realizeAccReadsThreshold;
}

memory::vector<Sym> IRGraph::sizes(IRNodeId tensor) const {
  const IRNode &node = (*this)[tensor];
  if (node.tag() == IRNodeKind::ReinterpretView) {
    return node.layout().sizes;
  }
  const IRNode &data = (*this)[dataOf(tensor)];
  switch (data.tag()) {
  case IRNodeKind::Pointwise:
    return data.pointwise().ranges;
  case IRNodeKind::Reduction:
    return data.reduction().ranges;
  default:
    return data.layout().sizes;
  }
}

TensorDataType IRGraph::dtype(IRNodeId tensor) const {
  const IRNode &node = (*this)[tensor];
  if (node.tag() == IRNodeKind::ReinterpretView) {
    return node.layout().dtype;
  }
  const IRNode &data = (*this)[dataOf(tensor)];
  switch (data.tag()) {
  case IRNodeKind::Pointwise:
    return data.pointwise().dtype;
  case IRNodeKind::Reduction:
    return data.reduction().dtype;
  default:
    return data.layout().dtype;
  }
}

Device IRGraph::device(IRNodeId tensor) const {
  const IRNode &node = (*this)[tensor];
  if (node.tag() == IRNodeKind::ReinterpretView) {
    return node.layout().device;
  }
  const IRNode &data = (*this)[dataOf(tensor)];
  switch (data.tag()) {
  case IRNodeKind::Pointwise:
    return data.pointwise().device;
  case IRNodeKind::Reduction:
    return data.reduction().device;
  default:
    return data.layout().device;
  }
}

Sym IRGraph::numel(IRNodeId tensor) const {
  const auto s = sizes(tensor);
  return m_env->product(s);
}

const Layout &IRGraph::layout(IRNodeId tensor) const {
  const IRNode &node = (*this)[tensor];
  if (node.tag() == IRNodeKind::ReinterpretView) {
    return node.layout();
  }
  const IRNode &data = (*this)[dataOf(tensor)];
  if (!data.isBuffer()) {
    diag::invalid_argument(
        fmt::format("{} is not realized and has no layout", tensor));
  }
  return data.layout();
}

void IRGraph::loadOperand(IRNodeId operand,
                          memory::vector<IRNodeId> &out) const {
  const IRNode &node = (*this)[operand];
  if (node.isLoops()) {
    collectReads(operand, out);
    return;
  }
  IRNodeId buffer = operand;
  if (node.tag() == IRNodeKind::ReinterpretView) {
    buffer = viewBuffer(operand);
  } else if (node.tag() == IRNodeKind::StorageBox) {
    buffer = node.storage().data;
  }
  if ((*this)[buffer].isLoops()) {
    collectReads(buffer, out);
  } else if (std::find(out.begin(), out.end(), buffer) == out.end()) {
    out.push_back(buffer);
  }
}

void IRGraph::collectReads(IRNodeId node, memory::vector<IRNodeId> &out) const {
  const IRNode &n = (*this)[node];
  switch (n.tag()) {
  case IRNodeKind::StorageBox:
    collectReads(n.storage().data, out);
    break;
  case IRNodeKind::ComputedBuffer:
    collectReads(n.computed().data, out);
    break;
  case IRNodeKind::Pointwise:
    for (IRNodeId in : n.pointwise().inputs) {
      loadOperand(in, out);
    }
    break;
  case IRNodeKind::Reduction:
    for (IRNodeId in : n.reduction().inputs) {
      loadOperand(in, out);
    }
    break;
  case IRNodeKind::ExternKernel:
    for (IRNodeId in : n.externKernel().inputs) {
      loadOperand(in, out);
    }
    break;
  case IRNodeKind::MultiOutput:
    loadOperand(n.multiOutput().kernel, out);
    break;
  case IRNodeKind::ReinterpretView:
    loadOperand(node, out);
    break;
  case IRNodeKind::InputBuffer:
  case IRNodeKind::ConstantBuffer:
    break;
  }
}

memory::vector<IRNodeId> IRGraph::readBuffers(IRNodeId tensor) const {
  memory::vector<IRNodeId> out;
  collectReads(tensor, out);
  return out;
}

std::size_t IRGraph::numReads(IRNodeId tensor) const {
  if (isView(tensor)) {
    return 1;
  }
  const IRNode &data = (*this)[dataOf(tensor)];
  switch (data.tag()) {
  case IRNodeKind::Pointwise:
  case IRNodeKind::Reduction:
  case IRNodeKind::ComputedBuffer:
    return readBuffers(tensor).size();
  default:
    return 1;
  }
}

memory::string IRGraph::bufferName(IRNodeId tensor) const {
  const IRNode &data = (*this)[dataOf(tensor)];
  if (!data.isBuffer()) {
    diag::invalid_argument(fmt::format("{} is not realized", tensor));
  }
  return data.bufferName();
}

memory::string IRGraph::renderSizes(memory::span<const Sym> syms) const {
  memory::string out = "[";
  for (std::size_t i = 0; i < syms.size(); ++i) {
    if (i != 0) {
      out += ", ";
    }
    out += m_env->to_string(syms[i]);
  }
  out += "]";
  return out;
}

memory::string IRGraph::render(IRNodeId id) const {
  const IRNode &node = (*this)[id];
  auto join = [&](memory::span<const IRNodeId> inputs,
                  memory::span<const memory::string> scalars) {
    memory::string out;
    for (IRNodeId in : inputs) {
      if (!out.empty()) {
        out += ", ";
      }
      out += render(in);
    }
    for (const auto &s : scalars) {
      if (!out.empty()) {
        out += ", ";
      }
      out += s;
    }
    return out;
  };
  switch (node.tag()) {
  case IRNodeKind::StorageBox:
    return render(node.storage().data);
  case IRNodeKind::ReinterpretView: {
    const Layout &l = node.layout();
    return fmt::format("reinterpret_tensor({}, {}, {}, {})",
                       (*this)[viewBuffer(id)].bufferName(),
                       renderSizes(l.sizes),
                       renderSizes(l.strides), m_env->to_string(l.offset));
  }
  case IRNodeKind::Pointwise: {
    const auto &pw = node.pointwise();
    return fmt::format("{}({})", pw.fn, join(pw.inputs, pw.scalars));
  }
  case IRNodeKind::Reduction: {
    const auto &red = node.reduction();
    return fmt::format("{}({}, {})", red.reductionType, join(red.inputs, {}),
                       renderSizes(red.reductionRanges));
  }
  default:
    return node.bufferName();
  }
}

} // namespace lowir::compiler
