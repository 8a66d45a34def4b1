#pragma once

#include "lowir/diag/logging.hpp"
#include "lowir/memory/container/hashset.hpp"
#include "lowir/memory/container/optional.hpp"
#include "lowir/memory/container/span.hpp"
#include "lowir/memory/container/string.hpp"
#include <cstdint>
#include <functional>

namespace lowir::compiler {

class LoweringRegistry;
class BackendRegistry;
struct ExternKernelNode;

// Properties of the host runtime the graph is lowered for.
struct RuntimeInfo {
  // ROCm build of the runtime.
  bool hip = false;
  bool gpuAvailable = false;
  bool mkldnnEnabled = true;
  bool mkldnnAvailable = false;
  bool mklAvailable = false;
  memory::string platform = "linux";
};

struct LayoutHeuristics {
  bool layoutOptimization = true;
  bool forceLayoutOptimization = false;
  // Graphs with at least this many nodes per convolution keep the default
  // layout.
  std::int64_t nodesPerConvThreshold = 300;
  // Convolutions where both channel counts are at most this bound do not
  // profit from channels-last.
  std::int64_t smallChannelBound = 64;
};

struct RealizeThresholds {
  std::int64_t realizeReadsThreshold = 4;
  std::int64_t realizeAccReadsThreshold = 8;
};

using ExternNodeSerializer =
    std::function<memory::string(memory::span<const ExternKernelNode>)>;

struct LoweringOptions {
  LayoutHeuristics layout;
  RealizeThresholds realize;

  bool implicitFallbacks = true;
  bool alwaysKeepTensorConstants = false;
  bool cppWrapper = false;
  bool aotMode = false;
  bool disableCppCodegen = false;

  // Graph output node names whose layout is observed by the caller.
  memory::hash_set<memory::string> userVisibleOutputs;
  // Overrides the layout heuristic when set.
  memory::optional<bool> layoutOpt;
  // The first N tensor inputs (parameters) are always sized statically.
  std::size_t numStaticInputs = 0;
  memory::optional<std::uint64_t> graphId;

  ExternNodeSerializer externNodeSerializer;
  RuntimeInfo runtime;

  // nullptr selects the process-wide registries.
  LoweringRegistry *registry = nullptr;
  BackendRegistry *backends = nullptr;

  diag::LogLevel loglevel = diag::LogLevel::Info;
};

} // namespace lowir::compiler
