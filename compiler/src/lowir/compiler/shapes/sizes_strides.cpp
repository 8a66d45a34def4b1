#include "lowir/compiler/shapes/sizes_strides.hpp"
#include "lowir/diag/precondition.hpp"
#include "lowir/memory/container/hashmap.hpp"
#include "lowir/memory/container/optional.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace lowir::compiler {

namespace {

void check_example(memory::span<const std::int64_t> sizes,
                   memory::span<const std::int64_t> strides) {
  diag::precondition(sizes.size() == strides.size(),
                     "example tensor has {} sizes but {} strides",
                     sizes.size(), strides.size());
  for (std::size_t d = 0; d < sizes.size(); ++d) {
    diag::precondition(sizes[d] >= 0, "example tensor has negative size {}",
                       sizes[d]);
    diag::precondition(strides[d] >= 0,
                       "example tensor has negative stride {}", strides[d]);
  }
}

} // namespace

SizesStrides symbolic_sizes_strides(memory::span<const std::int64_t> sizes,
                                    memory::span<const std::int64_t> strides,
                                    ShapeEnv &env,
                                    memory::string_view source) {
  check_example(sizes, strides);
  const std::size_t rank = sizes.size();

  SizesStrides out;
  out.sizes.reserve(rank);
  for (std::size_t d = 0; d < rank; ++d) {
    out.sizes.push_back(
        env.createSymbol(sizes[d], fmt::format("{}.size()[{}]", source, d)));
  }

  memory::vector<memory::optional<Sym>> bound(rank);
  for (std::size_t d = 0; d < rank; ++d) {
    if (strides[d] == 0 || strides[d] == 1) {
      bound[d] = Sym::Const(strides[d]);
    }
  }

  auto unbound = [&] {
    return std::any_of(bound.begin(), bound.end(),
                       [](const auto &s) { return !s.has_value(); });
  };

  while (unbound()) {
    // example value of size*stride -> expression for it
    memory::hash_map<std::int64_t, Sym> candidates;
    for (std::size_t d = 0; d < rank; ++d) {
      if (bound[d].has_value()) {
        candidates.insert_or_assign(sizes[d] * strides[d],
                                    env.mul(out.sizes[d], *bound[d]));
      }
    }

    memory::vector<std::size_t> pending;
    for (std::size_t d = 0; d < rank; ++d) {
      if (!bound[d].has_value()) {
        pending.push_back(d);
      }
    }
    std::stable_sort(pending.begin(), pending.end(),
                     [&](std::size_t a, std::size_t b) {
                       return strides[a] < strides[b];
                     });

    for (std::size_t d : pending) {
      auto it = candidates.find(strides[d]);
      if (it != candidates.end()) {
        bound[d] = it->second;
        candidates.insert_or_assign(sizes[d] * strides[d],
                                    env.mul(out.sizes[d], *bound[d]));
      }
    }

    if (unbound()) {
      // bind the smallest unbound stride to a fresh symbol
      std::size_t best = rank;
      for (std::size_t d = 0; d < rank; ++d) {
        if (!bound[d].has_value() &&
            (best == rank || strides[d] < strides[best])) {
          best = d;
        }
      }
      bound[best] = env.createSymbol(
          strides[best], fmt::format("{}.stride()[{}]", source, best));
    }
  }

  out.strides.reserve(rank);
  for (auto &s : bound) {
    out.strides.push_back(*s);
  }
  return out;
}

SizesStrides static_sizes_strides(memory::span<const std::int64_t> sizes,
                                  memory::span<const std::int64_t> strides) {
  check_example(sizes, strides);
  SizesStrides out;
  out.sizes.reserve(sizes.size());
  out.strides.reserve(strides.size());
  for (std::size_t d = 0; d < sizes.size(); ++d) {
    out.sizes.push_back(Sym::Const(sizes[d]));
    out.strides.push_back(Sym::Const(strides[d]));
  }
  return out;
}

} // namespace lowir::compiler
