#include "lowir/compiler/backend/BackendRegistry.hpp"
#include "lowir/compiler/backend/ReferenceBackend.hpp"
#include "lowir/diag/logging.hpp"

namespace lowir::compiler {

BackendRegistry::BackendRegistry(bool registerDefaults) {
  if (registerDefaults) {
    registerBackend(
        DeviceType::CPU,
        [] { return std::make_unique<ReferenceScheduling>(); },
        [](bool cppWrapper) {
          return std::make_unique<ReferenceWrapperCodegen>(cppWrapper);
        });
  }
}

BackendRegistry &BackendRegistry::global() {
  static BackendRegistry registry;
  return registry;
}

void BackendRegistry::registerBackend(DeviceType device,
                                      SchedulingFactory scheduling,
                                      WrapperCodegenFactory wrapper) {
  std::lock_guard lock{m_mutex};
  LOWIR_DEBUG("registered backend for {}", device);
  m_backends.insert_or_assign(
      device, Entry{std::move(scheduling), std::move(wrapper)});
}

bool BackendRegistry::supports(DeviceType device) const {
  std::lock_guard lock{m_mutex};
  return m_backends.contains(device);
}

std::unique_ptr<IScheduling>
BackendRegistry::schedulingFor(DeviceType device) const {
  std::lock_guard lock{m_mutex};
  auto it = m_backends.find(device);
  if (it == m_backends.end()) {
    return nullptr;
  }
  return it->second.scheduling();
}

std::unique_ptr<IWrapperCodegen>
BackendRegistry::wrapperCodegenFor(DeviceType device, bool cppWrapper) const {
  std::lock_guard lock{m_mutex};
  auto it = m_backends.find(device);
  if (it == m_backends.end()) {
    return nullptr;
  }
  return it->second.wrapper(cppWrapper);
}

} // namespace lowir::compiler
