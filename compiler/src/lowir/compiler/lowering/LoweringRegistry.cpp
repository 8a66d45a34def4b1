#include "lowir/compiler/lowering/LoweringRegistry.hpp"
#include "lowir/compiler/lowering/builtin/builtin.hpp"
#include "lowir/compiler/lowering/fallback.hpp"
#include "lowir/diag/logging.hpp"

namespace lowir::compiler {

LoweringRegistry::LoweringRegistry(bool registerBuiltins) {
  if (registerBuiltins) {
    register_builtin_lowerings(*this);
  }
}

LoweringRegistry &LoweringRegistry::global() {
  static LoweringRegistry registry;
  return registry;
}

void LoweringRegistry::registerLowering(const OpOverload &op, LoweringFn fn) {
  std::lock_guard lock{m_mutex};
  m_lowerings.insert_or_assign(op.fullName(), std::move(fn));
}

memory::optional<LoweringFn>
LoweringRegistry::find_impl(const OpOverload &op) const {
  auto it = m_lowerings.find(op.fullName());
  if (it != m_lowerings.end()) {
    return it->second;
  }
  // lowering registered for the whole overload packet
  it = m_lowerings.find(op.baseName());
  if (it != m_lowerings.end()) {
    return it->second;
  }
  return memory::nullopt;
}

memory::optional<LoweringFn>
LoweringRegistry::find(const OpOverload &op) const {
  std::lock_guard lock{m_mutex};
  return find_impl(op);
}

bool LoweringRegistry::contains(const OpOverload &op) const {
  std::lock_guard lock{m_mutex};
  return find_impl(op).has_value();
}

bool LoweringRegistry::makeFallback(const OpOverload &op,
                                    LayoutConstraint constraint) {
  std::lock_guard lock{m_mutex};
  m_needsRealizedInputs.insert(op.baseName());
  if (constraint) {
    m_layoutConstraints.insert_or_assign(op.fullName(), std::move(constraint));
  }
  m_fallbacks.insert(op.fullName());
  auto [it, inserted] =
      m_lowerings.try_emplace(op.fullName(), fallback_handler(op));
  if (inserted) {
    LOWIR_DEBUG("registered fallback for {}", op);
  }
  return inserted;
}

bool LoweringRegistry::isFallback(const OpOverload &op) const {
  std::lock_guard lock{m_mutex};
  return m_fallbacks.contains(op.fullName());
}

void LoweringRegistry::addToFallbackSet(const OpOverload &op) {
  std::lock_guard lock{m_mutex};
  m_fallbacks.insert(op.fullName());
}

void LoweringRegistry::registerDecomposition(const OpOverload &op) {
  std::lock_guard lock{m_mutex};
  m_decompositions.insert(op.fullName());
}

bool LoweringRegistry::hasDecomposition(const OpOverload &op) const {
  std::lock_guard lock{m_mutex};
  return m_decompositions.contains(op.fullName()) ||
         m_decompositions.contains(op.baseName());
}

void LoweringRegistry::addNeedsRealizedInputs(const OpOverload &op) {
  std::lock_guard lock{m_mutex};
  m_needsRealizedInputs.insert(op.baseName());
}

bool LoweringRegistry::needsRealizedInputs(const OpOverload &op) const {
  std::lock_guard lock{m_mutex};
  return m_needsRealizedInputs.contains(op.baseName());
}

void LoweringRegistry::addLayoutConstraint(const OpOverload &op,
                                           LayoutConstraint constraint) {
  std::lock_guard lock{m_mutex};
  m_layoutConstraints.insert_or_assign(op.fullName(), std::move(constraint));
}

memory::optional<LayoutConstraint>
LoweringRegistry::layoutConstraint(const OpOverload &op) const {
  std::lock_guard lock{m_mutex};
  auto it = m_layoutConstraints.find(op.fullName());
  if (it == m_layoutConstraints.end()) {
    return memory::nullopt;
  }
  return it->second;
}

bool LoweringRegistry::onFallbackAllowList(const OpOverload &op) {
  return op.baseName() == "torchvision::roi_align";
}

} // namespace lowir::compiler
