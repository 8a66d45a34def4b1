#include "lowir/compiler/GraphLowering.hpp"
#include "lowir/diag/invalid_argument.hpp"
#include "lowir/diag/logging.hpp"
#include "lowir/diag/precondition.hpp"
#include <fmt/format.h>

namespace lowir::compiler {

void GraphLowering::registerUsersOf(const Value &value) {
  value.forEachTensor([&](IRNodeId tensor) {
    for (IRNodeId buffer : m_ir.readBuffers(tensor)) {
      m_bufferReaders[buffer].push_back(tensor);
    }
  });
}

memory::span<const IRNodeId>
GraphLowering::readersOf(IRNodeId buffer) const {
  auto it = m_bufferReaders.find(buffer);
  if (it == m_bufferReaders.end()) {
    return {};
  }
  return it->second;
}

void GraphLowering::markBufferMutated(IRNodeId buffer) {
  m_mutatedBuffers.insert(buffer);
  auto it = m_bufferReaders.find(buffer);
  if (it == m_bufferReaders.end()) {
    return;
  }
  // reads of the old version must happen before the mutation
  const memory::vector<IRNodeId> readers = it->second;
  for (IRNodeId reader : readers) {
    m_ir.realize(reader);
  }
}

void GraphLowering::markBufferMutated(memory::string_view name) {
  const memory::optional<IRNodeId> buffer = getBuffer(name);
  if (!buffer.has_value()) {
    diag::invalid_argument(fmt::format("could not find buffer {}", name));
  }
  markBufferMutated(*buffer);
}

void GraphLowering::mutateTo(IRNodeId dst, IRNodeId src) {
  if (m_ir.isView(dst)) {
    diag::invalid_argument(
        fmt::format("in-place update of the view {} is not supported", dst));
  }
  const IRNodeId storage = m_ir.storageOf(dst);
  const IRNodeId previous = m_ir.dataOf(dst);
  if (m_ir[previous].isBuffer()) {
    markBufferMutated(previous);
  }
  const IRNodeId buffer = m_ir.realize(src);
  m_ir.at(storage).storage().data = buffer;
  LOWIR_TRACE("{} now holds {}", storage, m_ir[buffer].bufferName());
}

void GraphLowering::output(const Node &node) {
  diag::precondition(node.args.size() == 1 &&
                         node.args[0].tag() == ArgumentKind::List,
                     "output node expects a single list of results");
  Value results = lowerArgument(node.args[0]);
  m_outputs = results.list();
  for (const Value &out : m_outputs) {
    if (out.isTensor()) {
      m_ir.realize(out.tensor());
    }
  }

  for (std::size_t i = 0; i < m_inputs.size(); ++i) {
    const GraphInput &input = m_inputs[i];
    if (!input.original) {
      continue;
    }
    const IRNodeId box = input.value.tensor();
    m_ir.realize(box);
    const IRNodeId current = m_ir.dataOf(box);
    const IRNodeId original = m_ir.dataOf(input.original);
    if (current == original) {
      continue;
    }
    LOWIR_DEBUG("input {} was mutated, writing {} back", input.name,
                m_ir[current].bufferName());
    markBufferMutated(original);
    m_ir.copyInto(box, Layout::mutation(original, m_ir[original].layout()));
    m_mutatedInputs.insert(input.name);
    m_mutatedInputIdxs.push_back(i);
    // the caller observes the mutation through the input itself
    for (Value &out : m_outputs) {
      if (out.isTensor() && out.tensor() == box) {
        out = input.original;
      }
    }
  }

  finalize();
  LOWIR_DEBUG(
      "Force channels last inputs for {} conv for the current graph with id {}",
      m_numChannelsLastConv,
      m_options.graphId.has_value() ? static_cast<std::int64_t>(*m_options.graphId)
                                    : -1);
}

void GraphLowering::finalize() {
  for (IRNodeId buffer : m_ir.buffers()) {
    m_ir.decideLayout(buffer);
    addDevice(m_ir[buffer].layout().device);
  }
  m_finalized = true;
}

void GraphLowering::addDevice(const Device &device) {
  m_deviceTypes.insert(device.type);
  if (device.index.has_value()) {
    m_deviceIdxs.insert(*device.index);
  }
}

} // namespace lowir::compiler
