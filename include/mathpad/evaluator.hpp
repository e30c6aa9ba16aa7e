#pragma once
#include <stdexcept>
#include <string>
#include "mathpad/ast.hpp"
#include "mathpad/context.hpp"

namespace mathpad {

struct EvalError : std::runtime_error { using std::runtime_error::runtime_error; };

struct UndefinedVariableError : EvalError {
    explicit UndefinedVariableError(const std::string& name_)
        : EvalError("Undefined variable: " + name_), name(name_) {}
    std::string name;
};

struct DivisionByZeroError : EvalError {
    DivisionByZeroError() : EvalError("Division by zero") {}
};

// User-function frames deeper than this raise EvalError.
inline constexpr int kMaxCallDepth = 200;

/// Tree-walk `node` against `ctx`.
/// Throws EvalError (or a subclass) on undefined names, division by zero,
/// unknown functions, bad argument counts and runaway recursion.
double evaluate(const Node& node, const EvalContext& ctx);

} // namespace mathpad
