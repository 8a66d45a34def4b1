#pragma once

#include "lowir/compiler/backend/Backend.hpp"
#include "lowir/compiler/constants/ConstantTable.hpp"
#include "lowir/memory/container/optional.hpp"
#include "lowir/memory/container/string.hpp"
#include "lowir/memory/container/vector.hpp"
#include <cassert>
#include <variant>

namespace lowir::compiler {

struct LoadedModule {
  memory::string key;
  memory::string path;
  memory::vector<LineMapEntry> linemap;
};

// Content addressed store of generated code. Implementations guarantee at
// most one concurrent build per key.
class ICodeCache {
public:
  virtual ~ICodeCache() = default;

  virtual LoadedModule load(const memory::string &key,
                            const memory::string &code,
                            const ConstantTable &constants,
                            memory::vector<LineMapEntry> linemap) = 0;

  // Compiles C++ wrapper code ahead of time and returns the artifact path.
  virtual memory::string
  compileAot(const memory::string &key, const memory::string &code,
             const memory::optional<memory::string> &serializedExternKernels,
             bool cuda) = 0;
};

// Result of GraphLowering::compileToFn: a loaded module, or the path of an
// ahead-of-time compiled artifact.
class CompiledArtifact {
public:
  CompiledArtifact(LoadedModule module) : m_var(std::move(module)) {}
  CompiledArtifact(memory::string aotPath) : m_var(std::move(aotPath)) {}

  bool isAot() const { return std::holds_alternative<memory::string>(m_var); }

  const LoadedModule &module() const {
    assert(!isAot());
    return std::get<LoadedModule>(m_var);
  }

  const memory::string &aotPath() const {
    assert(isAot());
    return std::get<memory::string>(m_var);
  }

private:
  std::variant<LoadedModule, memory::string> m_var;
};

} // namespace lowir::compiler
