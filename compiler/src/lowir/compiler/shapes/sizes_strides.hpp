#pragma once

#include "lowir/compiler/graph/TensorMeta.hpp"
#include "lowir/memory/container/span.hpp"
#include "lowir/memory/container/string_view.hpp"
#include "lowir/memory/container/vector.hpp"
#include "lowir/symbolic/ShapeEnv.hpp"
#include "lowir/symbolic/Sym.hpp"

namespace lowir::compiler {

struct SizesStrides {
  memory::vector<Sym> sizes;
  memory::vector<Sym> strides;
};

// Duck-shaped symbolic sizes and strides for an example tensor. Symbols are
// allocated in `env` with `source` as provenance prefix. Strides that are the
// product of another dimension's size and stride reuse that expression.
SizesStrides symbolic_sizes_strides(memory::span<const std::int64_t> sizes,
                                    memory::span<const std::int64_t> strides,
                                    ShapeEnv &env, memory::string_view source);

inline SizesStrides symbolic_sizes_strides(const TensorMeta &meta,
                                           ShapeEnv &env,
                                           memory::string_view source) {
  return symbolic_sizes_strides(meta.sizes, meta.strides, env, source);
}

// Constant sizes and strides; never allocates symbols.
SizesStrides static_sizes_strides(memory::span<const std::int64_t> sizes,
                                  memory::span<const std::int64_t> strides);

inline SizesStrides static_sizes_strides(const TensorMeta &meta) {
  return static_sizes_strides(meta.sizes, meta.strides);
}

} // namespace lowir::compiler
