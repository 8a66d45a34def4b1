#pragma once

#include <cstdint>
#include <fmt/format.h>
#include <limits>

namespace lowir::compiler {

// Index of a node inside an IRGraph arena.
struct IRNodeId {
public:
  static constexpr std::uint64_t NullId{
      std::numeric_limits<std::uint64_t>::max()};

  explicit constexpr IRNodeId() : m_id(NullId) {}
  explicit constexpr IRNodeId(std::uint64_t id) : m_id(id) {}

  constexpr explicit operator std::uint64_t() const { return m_id; }

  constexpr explicit operator bool() const { return m_id != NullId; }

  constexpr std::uint64_t operator*() const { return m_id; }

  friend bool operator==(const IRNodeId &lhs, const IRNodeId &rhs) {
    return lhs.m_id == rhs.m_id;
  }

  friend bool operator!=(const IRNodeId &lhs, const IRNodeId &rhs) {
    return lhs.m_id != rhs.m_id;
  }

  friend bool operator<(const IRNodeId &lhs, const IRNodeId &rhs) {
    return lhs.m_id < rhs.m_id;
  }

private:
  std::uint64_t m_id;
};

} // namespace lowir::compiler

template <> struct std::hash<lowir::compiler::IRNodeId> {
  size_t operator()(const lowir::compiler::IRNodeId &id) const noexcept {
    return std::hash<std::uint64_t>{}(*id);
  }
};

template <> struct fmt::formatter<lowir::compiler::IRNodeId> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const lowir::compiler::IRNodeId &id, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "ir<{}>", static_cast<std::uint64_t>(id));
  }
};
