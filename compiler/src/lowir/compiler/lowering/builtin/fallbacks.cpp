#include "lowir/compiler/graph/OpOverload.hpp"
#include "lowir/compiler/lowering/LoweringRegistry.hpp"
#include "lowir/compiler/lowering/builtin/builtin.hpp"
#include "lowir/compiler/lowering/constraints.hpp"

namespace lowir::compiler {

void register_default_fallbacks(LoweringRegistry &registry) {
  registry.makeFallback(ops::aten("convolution_backward"),
                        constrain_to_fx_strides);
  registry.makeFallback(ops::aten("_embedding_bag"), constrain_to_fx_strides);
  registry.makeFallback(ops::aten("_cudnn_rnn"));
  registry.makeFallback(ops::aten("_scaled_dot_product_flash_attention"));
  registry.makeFallback(ops::aten("_scaled_dot_product_efficient_attention"));

  // operators with a known decomposition into supported operators
  for (const char *name : {"native_layer_norm", "native_group_norm",
                           "native_batch_norm", "silu", "hardswish",
                           "logsumexp", "addcmul"}) {
    registry.registerDecomposition(ops::aten(name, ""));
  }
}

} // namespace lowir::compiler
