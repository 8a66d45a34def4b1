#pragma once

namespace lowir::compiler {

class LoweringRegistry;

void register_pointwise_lowerings(LoweringRegistry &registry);
void register_reduction_lowerings(LoweringRegistry &registry);
void register_view_lowerings(LoweringRegistry &registry);
void register_extern_lowerings(LoweringRegistry &registry);
void register_mutation_lowerings(LoweringRegistry &registry);
void register_symbolic_lowerings(LoweringRegistry &registry);
void register_default_fallbacks(LoweringRegistry &registry);

inline void register_builtin_lowerings(LoweringRegistry &registry) {
  register_pointwise_lowerings(registry);
  register_reduction_lowerings(registry);
  register_view_lowerings(registry);
  register_extern_lowerings(registry);
  register_mutation_lowerings(registry);
  register_symbolic_lowerings(registry);
  register_default_fallbacks(registry);
}

} // namespace lowir::compiler
