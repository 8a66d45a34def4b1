#pragma once

#include "lowir/compiler/graph/OpOverload.hpp"
#include "lowir/compiler/lowering/LoweringFn.hpp"
#include "lowir/memory/container/hashmap.hpp"
#include "lowir/memory/container/hashset.hpp"
#include "lowir/memory/container/optional.hpp"
#include "lowir/memory/container/string.hpp"
#include "lowir/memory/container/string_view.hpp"
#include <mutex>

namespace lowir::compiler {

// Maps operators to lowering functions.
//
// A lowering registered for an operator without overload ("aten::add")
// covers every overload of it. Fallback registrations made while lowering a
// graph stay registered for the lifetime of the registry; all members are
// internally synchronized.
class LoweringRegistry {
public:
  explicit LoweringRegistry(bool registerBuiltins = true);

  LoweringRegistry(const LoweringRegistry &) = delete;
  LoweringRegistry &operator=(const LoweringRegistry &) = delete;

  // Process-wide registry with the builtin lowerings.
  static LoweringRegistry &global();

  void registerLowering(const OpOverload &op, LoweringFn fn);
  memory::optional<LoweringFn> find(const OpOverload &op) const;
  bool contains(const OpOverload &op) const;

  // Registers a fallback kernel for `op` unless a lowering already exists.
  // Returns true if the fallback was inserted.
  bool makeFallback(const OpOverload &op, LayoutConstraint constraint = {});
  bool isFallback(const OpOverload &op) const;
  void addToFallbackSet(const OpOverload &op);

  void registerDecomposition(const OpOverload &op);
  bool hasDecomposition(const OpOverload &op) const;

  // Lowerings of these operators read their inputs from memory.
  void addNeedsRealizedInputs(const OpOverload &op);
  bool needsRealizedInputs(const OpOverload &op) const;

  void addLayoutConstraint(const OpOverload &op, LayoutConstraint constraint);
  memory::optional<LayoutConstraint>
  layoutConstraint(const OpOverload &op) const;

  // Operators that always lower through a fallback kernel when no lowering is
  // registered, independent of the implicit fallback setting.
  static bool onFallbackAllowList(const OpOverload &op);

private:
  memory::optional<LoweringFn> find_impl(const OpOverload &op) const;

  mutable std::mutex m_mutex;
  memory::hash_map<memory::string, LoweringFn> m_lowerings;
  memory::hash_set<memory::string> m_fallbacks;
  memory::hash_set<memory::string> m_decompositions;
  memory::hash_set<memory::string> m_needsRealizedInputs;
  memory::hash_map<memory::string, LayoutConstraint> m_layoutConstraints;
};

} // namespace lowir::compiler
