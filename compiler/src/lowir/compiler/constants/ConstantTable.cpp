#include "lowir/compiler/constants/ConstantTable.hpp"
#include "lowir/diag/invalid_argument.hpp"
#include "lowir/diag/logging.hpp"
#include <cctype>
#include <fmt/format.h>

namespace lowir::compiler {

memory::string ConstantTable::qualifyName(memory::string_view name) {
  memory::string out(name);
  for (char &c : out) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
      c = '_';
    }
  }
  return out;
}

memory::string
ConstantTable::add(const HostTensor &value,
                   memory::optional<memory::string_view> suggestedName) {
  for (const auto &entry : m_entries) {
    if (entry.value.sameContent(value)) {
      LOWIR_TRACE("constant deduplicated into {}", entry.name);
      return entry.name;
    }
  }

  memory::string name;
  if (suggestedName.has_value() && !suggestedName->empty()) {
    name = memory::string(*suggestedName);
  } else {
    name = fmt::format("constant{}", m_entries.size());
  }
  if (std::isdigit(static_cast<unsigned char>(name.front()))) {
    name = "constant_" + name;
  }
  name = qualifyName(name);

  const memory::string prefix = name;
  std::size_t cnt = 0;
  while (contains(name)) {
    name = fmt::format("{}_{}", prefix, cnt++);
  }
  return insert(std::move(name), value);
}

memory::string ConstantTable::insert(memory::string name, HostTensor value) {
  SHA256 hash = value.contentHash();
  m_index.emplace(name, m_entries.size());
  m_entries.push_back(ConstantEntry{
      .name = name,
      .value = std::move(value),
      .hash = hash,
  });
  return name;
}

memory::string ConstantTable::nameOn(memory::string_view name,
                                     const Device &device) {
  const ConstantEntry &entry = get(name);
  if (entry.value.device() == device) {
    return entry.name;
  }
  memory::string alt = fmt::format("{}_{}{}", name, device.type,
                                   device.index.value_or(0));
  if (!contains(alt)) {
    HostTensor copy = entry.value.to(device);
    insert(alt, std::move(copy));
  }
  return alt;
}

bool ConstantTable::contains(memory::string_view name) const {
  return m_index.contains(memory::string(name));
}

const ConstantEntry &ConstantTable::get(memory::string_view name) const {
  auto it = m_index.find(memory::string(name));
  if (it == m_index.end()) {
    diag::invalid_argument(fmt::format("unknown constant {}", name));
  }
  return m_entries[it->second];
}

} // namespace lowir::compiler
