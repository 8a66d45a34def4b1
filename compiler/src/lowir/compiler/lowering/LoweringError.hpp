#pragma once

#include "lowir/compiler/diag/exceptions.hpp"
#include "lowir/compiler/graph/OpOverload.hpp"
#include "lowir/compiler/ir/Value.hpp"
#include "lowir/diag/unreachable.hpp"
#include "lowir/memory/container/string.hpp"
#include <cassert>
#include <exception>
#include <variant>

namespace lowir::compiler {

enum class LoweringErrorKind {
  MissingWithDecomp,
  MissingWithoutDecomp,
  WrappedFailure,
};

struct MissingWithDecomp {
  OpOverload op;
  memory::string args;
};

struct MissingWithoutDecomp {
  OpOverload op;
  memory::string args;
};

// A lowering handler threw.
struct WrappedFailure {
  OpOverload op;
  memory::string args;
  memory::string message;
  std::exception_ptr cause;
};

class LoweringError {
public:
  LoweringError(MissingWithDecomp e) : m_var(std::move(e)) {}
  LoweringError(MissingWithoutDecomp e) : m_var(std::move(e)) {}
  LoweringError(WrappedFailure e) : m_var(std::move(e)) {}

  LoweringErrorKind tag() const {
    return static_cast<LoweringErrorKind>(m_var.index());
  }

  const OpOverload &op() const {
    return std::visit([](const auto &e) -> const OpOverload & { return e.op; },
                      m_var);
  }

  const WrappedFailure &wrapped() const {
    assert(std::holds_alternative<WrappedFailure>(m_var));
    return std::get<WrappedFailure>(m_var);
  }

  // Converts the error into the matching exception.
  [[noreturn]] void raise() const {
    switch (tag()) {
    case LoweringErrorKind::MissingWithDecomp: {
      const auto &e = std::get<MissingWithDecomp>(m_var);
      throw MissingOperatorWithDecomp(e.op, e.args);
    }
    case LoweringErrorKind::MissingWithoutDecomp: {
      const auto &e = std::get<MissingWithoutDecomp>(m_var);
      throw MissingOperatorWithoutDecomp(e.op, e.args);
    }
    case LoweringErrorKind::WrappedFailure: {
      const auto &e = std::get<WrappedFailure>(m_var);
      throw LoweringException(e.op, e.args, e.message, e.cause);
    }
    }
    diag::unreachable();
  }

private:
  std::variant<MissingWithDecomp, MissingWithoutDecomp, WrappedFailure> m_var;
};

// Value of a dispatched lowering or the reason dispatch failed.
class LoweringResult {
public:
  LoweringResult(Value value) : m_var(std::move(value)) {}
  LoweringResult(LoweringError error) : m_var(std::move(error)) {}

  bool ok() const { return std::holds_alternative<Value>(m_var); }
  explicit operator bool() const { return ok(); }

  const Value &value() const {
    assert(ok());
    return std::get<Value>(m_var);
  }

  Value &value() {
    assert(ok());
    return std::get<Value>(m_var);
  }

  const LoweringError &error() const {
    assert(!ok());
    return std::get<LoweringError>(m_var);
  }

  // The value, or the error raised as an exception.
  Value unwrap() && {
    if (!ok()) {
      error().raise();
    }
    return std::move(std::get<Value>(m_var));
  }

private:
  std::variant<Value, LoweringError> m_var;
};

} // namespace lowir::compiler
