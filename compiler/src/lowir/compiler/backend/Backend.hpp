#pragma once

#include "lowir/compiler/ir/IRNodeId.hpp"
#include "lowir/memory/NodeId.hpp"
#include "lowir/memory/container/string.hpp"
#include "lowir/memory/container/vector.hpp"

namespace lowir::compiler {

class GraphLowering;

// Generated line -> graph node that produced the code on that line.
struct LineMapEntry {
  std::size_t line;
  memory::NodeId node{};
};

struct GeneratedCode {
  memory::string code;
  memory::vector<LineMapEntry> linemap;
};

// Buffers computed by one kernel.
struct KernelGroup {
  memory::vector<IRNodeId> buffers;
};

struct Schedule {
  memory::vector<KernelGroup> groups;
};

// Groups the realized buffers of a finished lowering into kernels.
class IScheduling {
public:
  virtual ~IScheduling() = default;
  virtual Schedule schedule(const GraphLowering &graph) = 0;
};

// Emits the host-side code calling the scheduled kernels.
class IWrapperCodegen {
public:
  virtual ~IWrapperCodegen() = default;
  virtual GeneratedCode generate(const GraphLowering &graph,
                                 const Schedule &schedule) = 0;
};

} // namespace lowir::compiler
