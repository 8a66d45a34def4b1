#pragma once

#include "lowir/compiler/graph/OpOverload.hpp"
#include "lowir/memory/container/string.hpp"
#include <exception>
#include <fmt/format.h>
#include <stdexcept>

namespace lowir::compiler {

// No lowering is registered and no fallback applies, but a decomposition is
// known. Recoverable by enabling decompositions or implicit fallbacks.
class MissingOperatorWithDecomp : public std::runtime_error {
public:
  MissingOperatorWithDecomp(OpOverload op, memory::string args)
      : std::runtime_error(fmt::format(
            "missing lowering for {} (a decomposition exists, run the graph "
            "through it or enable implicit fallbacks)\n  args: {}",
            op, args)),
        m_op(std::move(op)), m_args(std::move(args)) {}

  const OpOverload &op() const { return m_op; }
  const memory::string &args() const { return m_args; }

private:
  OpOverload m_op;
  memory::string m_args;
};

class MissingOperatorWithoutDecomp : public std::runtime_error {
public:
  MissingOperatorWithoutDecomp(OpOverload op, memory::string args)
      : std::runtime_error(fmt::format(
            "missing lowering for {} and no decomposition is known\n  args: {}",
            op, args)),
        m_op(std::move(op)), m_args(std::move(args)) {}

  const OpOverload &op() const { return m_op; }
  const memory::string &args() const { return m_args; }

private:
  OpOverload m_op;
  memory::string m_args;
};

// Failure raised from inside a lowering handler.
class LoweringException : public std::runtime_error {
public:
  LoweringException(OpOverload op, memory::string args, memory::string what,
                    std::exception_ptr cause)
      : std::runtime_error(fmt::format("{}: {}\n  target: {}\n  args: {}",
                                       "LoweringException", what, op, args)),
        m_op(std::move(op)), m_args(std::move(args)), m_causeMessage(what),
        m_cause(std::move(cause)) {}

  const OpOverload &op() const { return m_op; }
  const memory::string &args() const { return m_args; }
  const memory::string &causeMessage() const { return m_causeMessage; }
  std::exception_ptr cause() const { return m_cause; }

  [[noreturn]] void rethrowCause() const { std::rethrow_exception(m_cause); }

private:
  OpOverload m_op;
  memory::string m_args;
  memory::string m_causeMessage;
  std::exception_ptr m_cause;
};

// The requested code generation path cannot be taken for this graph.
class CodeGenPrecondition : public std::runtime_error {
public:
  explicit CodeGenPrecondition(const memory::string &msg)
      : std::runtime_error(msg) {}
};

} // namespace lowir::compiler
