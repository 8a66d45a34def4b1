#include "lowir/common/SHA256.hpp"
#include "lowir/compiler/GraphLowering.hpp"
#include "lowir/compiler/backend/BackendRegistry.hpp"
#include "lowir/compiler/diag/exceptions.hpp"
#include "lowir/diag/logging.hpp"
#include "lowir/diag/precondition.hpp"
#include <fmt/format.h>

namespace lowir::compiler {

namespace {

bool supported_by_cpp_wrapper(memory::optional<TensorDataType> dtype,
                              bool cuda) {
  if (!dtype.has_value()) {
    return false;
  }
  switch (*dtype) {
  case TensorDataType::Float32:
  case TensorDataType::Float64:
  case TensorDataType::Int64:
  case TensorDataType::Int32:
  case TensorDataType::Int16:
  case TensorDataType::Int8:
  case TensorDataType::UInt8:
  case TensorDataType::Bool:
  case TensorDataType::BFloat16:
  case TensorDataType::Complex64:
    return true;
  case TensorDataType::Float16:
    return cuda;
  }
  return false;
}

// Key of the generated module: the code and every constant it refers to.
memory::string module_key(const GeneratedCode &code,
                          const ConstantTable &constants) {
  SHA256Builder builder;
  builder.update(code.code);
  for (const ConstantEntry &entry : constants.entries()) {
    builder.update(entry.name);
    builder.update(entry.hash.hex());
  }
  return builder.finalize().hex();
}

} // namespace

void GraphLowering::validateCanGenerateCppWrapper() const {
  if (m_options.disableCppCodegen) {
    throw CodeGenPrecondition("C++ codegen is disabled");
  }
  if (m_options.runtime.platform != "linux") {
    throw CodeGenPrecondition(
        fmt::format("Unsupported platform {}", m_options.runtime.platform));
  }
  const bool cuda = m_deviceTypes.contains(DeviceType::CUDA);
  for (const GraphInput &input : m_inputs) {
    memory::optional<TensorDataType> dtype;
    memory::string described = "bool";
    switch (input.value.tag()) {
    case ValueKind::Tensor:
      dtype = m_ir.dtype(input.value.tensor());
      break;
    case ValueKind::Int:
      dtype = TensorDataType::Int64;
      break;
    case ValueKind::Float:
      dtype = TensorDataType::Float32;
      break;
    default:
      break;
    }
    if (dtype.has_value()) {
      described = memory::string(to_string(*dtype));
    }
    if (!supported_by_cpp_wrapper(dtype, cuda)) {
      throw CodeGenPrecondition(
          fmt::format("Unsupported input dtype {} of {}", described, input.name));
    }
  }
}

DeviceType GraphLowering::initWrapperCode() {
  const bool cuda = m_deviceTypes.contains(DeviceType::CUDA);
  DeviceType device = DeviceType::CPU;
  if (m_options.cppWrapper) {
    validateCanGenerateCppWrapper();
    device = cuda ? DeviceType::CUDA : DeviceType::CPU;
  } else {
    memory::hash_set<DeviceType> types = m_deviceTypes;
    types.erase(DeviceType::CPU);
    if (types.size() > 1) {
      memory::string names;
      for (DeviceType t : types) {
        names += names.empty() ? "" : ", ";
        names += memory::string(to_string(t));
      }
      throw CodeGenPrecondition(fmt::format("Does not support mixing {}", names));
    }
    if (!types.empty()) {
      device = *types.begin();
    }
  }
  if (!m_backends->supports(device)) {
    throw CodeGenPrecondition(
        fmt::format("no backend registered for device {}", device));
  }
  m_wrapperDevice = device;
  return device;
}

GeneratedCode GraphLowering::codegen() {
  diag::precondition(m_finalized, "codegen requires a lowered graph");
  const DeviceType device = initWrapperCode();
  std::unique_ptr<IScheduling> scheduling = m_backends->schedulingFor(device);
  std::unique_ptr<IWrapperCodegen> wrapper =
      m_backends->wrapperCodegenFor(device, m_options.cppWrapper);
  if (scheduling == nullptr || wrapper == nullptr) {
    throw CodeGenPrecondition(
        fmt::format("no backend registered for device {}", device));
  }
  const Schedule schedule = scheduling->schedule(*this);
  LOWIR_DEBUG("scheduled {} buffers into {} kernels", m_ir.buffers().size(),
              schedule.groups.size());
  return wrapper->generate(*this, schedule);
}

LoadedModule GraphLowering::compileToModule(ICodeCache &cache) {
  GeneratedCode generated = codegen();
  const memory::string key = module_key(generated, m_constants);
  LoadedModule module =
      cache.load(key, generated.code, m_constants, std::move(generated.linemap));
  LOWIR_DEBUG("Output code written to: {}", module.path);
  m_module = module;
  return module;
}

CompiledArtifact GraphLowering::compileToFn(ICodeCache &cache) {
  if (!(m_options.aotMode && m_options.cppWrapper)) {
    return compileToModule(cache);
  }
  const GeneratedCode generated = codegen();
  memory::optional<memory::string> serialized;
  if (!m_externKernelNodes.empty() && m_options.externNodeSerializer) {
    serialized = m_options.externNodeSerializer(m_externKernelNodes);
  }
  const memory::string key = module_key(generated, m_constants);
  memory::string path = cache.compileAot(
      key, generated.code, serialized, m_wrapperDevice == DeviceType::CUDA);
  LOWIR_DEBUG("ahead-of-time artifact written to: {}", path);
  return CompiledArtifact{std::move(path)};
}

} // namespace lowir::compiler
