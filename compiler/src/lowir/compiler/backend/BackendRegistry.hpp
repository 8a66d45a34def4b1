#pragma once

#include "lowir/common/Device.hpp"
#include "lowir/compiler/backend/Backend.hpp"
#include "lowir/memory/container/hashmap.hpp"
#include <functional>
#include <memory>
#include <mutex>

namespace lowir::compiler {

using SchedulingFactory = std::function<std::unique_ptr<IScheduling>()>;
using WrapperCodegenFactory =
    std::function<std::unique_ptr<IWrapperCodegen>(bool cppWrapper)>;

// Backends by device type.
class BackendRegistry {
public:
  // The reference backend is registered for the CPU unless disabled.
  explicit BackendRegistry(bool registerDefaults = true);

  BackendRegistry(const BackendRegistry &) = delete;
  BackendRegistry &operator=(const BackendRegistry &) = delete;

  static BackendRegistry &global();

  void registerBackend(DeviceType device, SchedulingFactory scheduling,
                       WrapperCodegenFactory wrapper);

  bool supports(DeviceType device) const;

  // nullptr if no backend is registered for the device.
  std::unique_ptr<IScheduling> schedulingFor(DeviceType device) const;
  std::unique_ptr<IWrapperCodegen> wrapperCodegenFor(DeviceType device,
                                                     bool cppWrapper) const;

private:
  struct Entry {
    SchedulingFactory scheduling;
    WrapperCodegenFactory wrapper;
  };

  mutable std::mutex m_mutex;
  memory::hash_map<DeviceType, Entry> m_backends;
};

} // namespace lowir::compiler
