#pragma once

#include "lowir/compiler/backend/Backend.hpp"

namespace lowir::compiler {

// One kernel per realized buffer, in buffer order.
class ReferenceScheduling final : public IScheduling {
public:
  Schedule schedule(const GraphLowering &graph) override;
};

// Emits a readable listing of the lowered program: a python-like `call`
// function, or a C++-like one when `cppWrapper` is set.
class ReferenceWrapperCodegen final : public IWrapperCodegen {
public:
  explicit ReferenceWrapperCodegen(bool cppWrapper) : m_cppWrapper(cppWrapper) {}

  GeneratedCode generate(const GraphLowering &graph,
                         const Schedule &schedule) override;

private:
  bool m_cppWrapper;
};

} // namespace lowir::compiler
