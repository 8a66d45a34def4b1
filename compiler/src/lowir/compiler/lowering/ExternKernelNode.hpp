#pragma once

#include "lowir/memory/container/string.hpp"
#include "lowir/memory/container/vector.hpp"

namespace lowir::compiler {

// Serializable record of a call into an opaque kernel, consumed by ahead of
// time compilation.
struct ExternKernelNode {
  // Name of the buffer produced by the call.
  memory::string name;
  // Fully qualified operator, e.g. "aten::_embedding_bag.default".
  memory::string kernel;
  memory::vector<memory::string> inputs;
  memory::vector<memory::string> constantArgs;
  memory::vector<memory::string> outputs;
};

} // namespace lowir::compiler
