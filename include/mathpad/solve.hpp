#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "mathpad/config.hpp"
#include "mathpad/context.hpp"

namespace mathpad {

struct SolveResult {
    std::string text;
    int solved{0};                   // values computed by equations
    std::vector<std::string> errors; // "Line N: message", in discovery order
};

// Equation rounds run until one changes nothing, at most this many times.
inline constexpr int kMaxSolveRounds = 50;

/// Shared context for a set of documents.
/// constants_text: `name: value "comment"` per line.
/// functions_text: `name(p1;p2) = body` definitions.
/// Throws ParseError when a function body does not parse.
EvalContext create_context(std::string_view constants_text, std::string_view functions_text,
                           const Config& cfg = Config{});

/// Solve a document against `context`. The context is not modified.
SolveResult solve(std::string_view text, const EvalContext& context, const Config& cfg = Config{});

} // namespace mathpad
