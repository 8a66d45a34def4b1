#include "lowir/compiler/GraphLowering.hpp"
#include "lowir/diag/invalid_argument.hpp"
#include "lowir/diag/logging.hpp"
#include <fmt/format.h>

namespace lowir::compiler {

namespace {

// "as_strided(buf0, ...)" or "reinterpret_tensor(buf0, ...)" -> "buf0"
memory::optional<memory::string_view>
strided_base_name(memory::string_view name) {
  for (memory::string_view prefix : {"as_strided(", "reinterpret_tensor("}) {
    if (!name.starts_with(prefix)) {
      continue;
    }
    const memory::string_view rest = name.substr(prefix.size());
    const auto comma = rest.find(',');
    if (comma == memory::string_view::npos || comma == 0) {
      return memory::nullopt;
    }
    return rest.substr(0, comma);
  }
  return memory::nullopt;
}

} // namespace

memory::optional<IRNodeId>
GraphLowering::getBuffer(memory::string_view name) const {
  if (auto buffer = m_ir.bufferByName(name)) {
    return buffer;
  }
  if (const GraphInput *input = graphInput(name);
      input != nullptr && input->original) {
    return m_ir.dataOf(input->original);
  }
  return memory::nullopt;
}

TensorDataType GraphLowering::getDtype(memory::string_view name) const {
  if (m_constants.contains(name)) {
    return m_constants.get(name).value.dtype();
  }
  if (auto buffer = getBuffer(name)) {
    return m_ir[*buffer].layout().dtype;
  }
  if (auto base = strided_base_name(name)) {
    return getDtype(*base);
  }
  diag::invalid_argument(fmt::format("could not find {}", name));
}

Sym GraphLowering::getNumel(memory::string_view name) const {
  if (m_constants.contains(name)) {
    return Sym::Const(m_constants.get(name).value.numel());
  }
  if (auto buffer = getBuffer(name)) {
    const Layout &layout = m_ir[*buffer].layout();
    if (layout.kind == LayoutKind::MultiOutput) {
      return Sym::Const(1);
    }
    return m_shapeEnv->product(layout.sizes);
  }
  diag::invalid_argument(fmt::format("could not find {}", name));
}

bool GraphLowering::isUnspecArg(memory::string_view name) const {
  const GraphInput *input = graphInput(name);
  if (input == nullptr || !input->value.isTensor()) {
    return false;
  }
  const IRNodeId tensor = input->value.tensor();
  return m_ir.numel(tensor) == Sym::Const(1) && m_ir.device(tensor).isCpu();
}

memory::string
GraphLowering::registerList(memory::span<const memory::string> names) {
  memory::string name = "list";
  for (const auto &n : names) {
    name += "_" + n;
  }
  m_lists.insert_or_assign(name, memory::vector<memory::string>(
                                     names.begin(), names.end()));
  return name;
}

memory::vector<memory::string> GraphLowering::getOutputNames() const {
  memory::vector<memory::string> names;
  for (const Value &out : m_outputs) {
    // scalar and None outputs are returned by value
    if (out.isTensor()) {
      names.push_back(m_ir.bufferName(out.tensor()));
    }
  }
  return names;
}

void GraphLowering::warnFallback(memory::string_view name) {
  if (m_warnedFallbacks.insert(memory::string(name)).second) {
    LOWIR_PERF_HINT("Using FallbackKernel: {}", name);
  }
}

void GraphLowering::recordExternKernel(ExternKernelNode node) {
  m_externKernelNodes.push_back(std::move(node));
}

} // namespace lowir::compiler
