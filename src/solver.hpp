#ifndef PAYCALC_SOLVER_HPP
#define PAYCALC_SOLVER_HPP

#include <cmath>
#include <limits>

namespace paycalc {

constexpr double DEFAULT_TOLERANCE = 0.01;        // One cent
constexpr int DEFAULT_MAX_ITERATIONS = 50;
constexpr int DEFAULT_MAX_BRACKET_EXPANSIONS = 16;

// Tuning for numeric inversion
struct SolverOptions {
    double tolerance;
    int max_iterations;
    int max_bracket_expansions;   // Upper-bound doublings before bisecting

    SolverOptions()
        : tolerance(DEFAULT_TOLERANCE),
          max_iterations(DEFAULT_MAX_ITERATIONS),
          max_bracket_expansions(DEFAULT_MAX_BRACKET_EXPANSIONS) {}
};

struct SolveResult {
    double value;       // Last midpoint evaluated
    double residual;    // |f(value) - target|, infinity if nothing was evaluated
    int iterations;     // Function evaluations spent bisecting
    bool converged;     // residual < tolerance
};

// Bisection over a non-decreasing f on [low, high].
// Returns the first midpoint whose image lies within tolerance of target,
// otherwise the last midpoint after max_iterations. Never throws on
// non-convergence; callers inspect `converged`.
template <typename F>
SolveResult bisect(F&& f, double target, double low, double high,
                   double tolerance = DEFAULT_TOLERANCE,
                   int max_iterations = DEFAULT_MAX_ITERATIONS) {
    SolveResult result;
    result.value = (low + high) / 2.0;
    result.residual = std::numeric_limits<double>::infinity();
    result.iterations = 0;
    result.converged = false;

    for (int i = 0; i < max_iterations; ++i) {
        const double mid = (low + high) / 2.0;
        const double value = f(mid);
        result.value = mid;
        result.residual = std::fabs(value - target);
        result.iterations = i + 1;

        if (result.residual < tolerance) {
            result.converged = true;
            return result;
        }
        if (value > target) {
            high = mid;
        } else {
            low = mid;
        }
    }
    return result;
}

// Plain-value form of bisect()
template <typename F>
double solve_monotonic(F&& f, double target, double low, double high,
                       double tolerance = DEFAULT_TOLERANCE,
                       int max_iterations = DEFAULT_MAX_ITERATIONS) {
    return bisect(f, target, low, high, tolerance, max_iterations).value;
}

struct Bracket {
    double low;
    double high;
    int expansions;
};

// Doubles `high` (moving `low` up to the old `high`) while f(high) < target,
// at most max_expansions times. A zero upper bound is left alone.
template <typename F>
Bracket expand_upper_bound(F&& f, double target, double low, double high,
                           int max_expansions = DEFAULT_MAX_BRACKET_EXPANSIONS) {
    Bracket bracket{low, high, 0};
    while (bracket.expansions < max_expansions && bracket.high > 0.0 &&
           f(bracket.high) < target) {
        bracket.low = bracket.high;
        bracket.high *= 2.0;
        ++bracket.expansions;
    }
    return bracket;
}

} // namespace paycalc

#endif // PAYCALC_SOLVER_HPP
