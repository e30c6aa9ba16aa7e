#pragma once
#include <functional>
#include <optional>
#include <stdexcept>

namespace mathpad {

struct SolveError : std::runtime_error { using std::runtime_error::runtime_error; };
struct NoRootError : SolveError { using SolveError::SolveError; };
struct NoConvergenceError : SolveError { using SolveError::SolveError; };

struct Limits {
    double low;
    double high;
};

// Hard cap on calls to f per find_root.
inline constexpr int kMaxEvaluations = 2000;

/// Find x with f(x) ~ 0. f should return NaN where it is undefined.
/// With limits the root is searched inside [low, high] only.
/// A small |f| only counts where f crosses or touches zero; poles are skipped.
/// Throws NoRootError when nothing brackets a root, NoConvergenceError
/// when the evaluation or iteration budget runs out.
double find_root(const std::function<double(double)>& f, std::optional<Limits> limits = std::nullopt);

} // namespace mathpad
