#pragma once

#include "lowir/common/Device.hpp"
#include "lowir/common/HostTensor.hpp"
#include "lowir/common/SHA256.hpp"
#include "lowir/memory/container/hashmap.hpp"
#include "lowir/memory/container/optional.hpp"
#include "lowir/memory/container/string.hpp"
#include "lowir/memory/container/string_view.hpp"
#include "lowir/memory/container/vector.hpp"

namespace lowir::compiler {

struct ConstantEntry {
  memory::string name;
  HostTensor value;
  SHA256 hash;
};

// Named tensor constants of one lowering, in registration order.
class ConstantTable {
public:
  // Returns the name of an existing bitwise-identical constant, or registers
  // `value` under a sanitized, collision-free name derived from
  // `suggestedName` ("constant{N}" when absent).
  memory::string add(const HostTensor &value,
                     memory::optional<memory::string_view> suggestedName = {});

  // Name under which `name` is available on `device`. Per-device copies are
  // created on first request and cached as "{name}_{type}{index}".
  memory::string nameOn(memory::string_view name, const Device &device);

  bool contains(memory::string_view name) const;
  const ConstantEntry &get(memory::string_view name) const;
  const memory::vector<ConstantEntry> &entries() const { return m_entries; }
  std::size_t size() const { return m_entries.size(); }

  static memory::string qualifyName(memory::string_view name);

private:
  memory::string insert(memory::string name, HostTensor value);

  memory::vector<ConstantEntry> m_entries;
  memory::hash_map<memory::string, std::size_t> m_index;
};

} // namespace lowir::compiler
