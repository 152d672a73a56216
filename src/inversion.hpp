#ifndef PAYCALC_INVERSION_HPP
#define PAYCALC_INVERSION_HPP

#include <string>
#include "jurisdiction.hpp"
#include "solver.hpp"

namespace paycalc {

// Which quantity a caller's value refers to
enum class TargetMode : uint8_t {
    Gross = 0,
    Net = 1,
    TotalCost = 2
};

std::string to_string(TargetMode mode);

// Accepts "gross", "net", "total-cost", "total_cost", "cost", "entire"
// (case-insensitive).
// Throws InvalidInputError otherwise.
TargetMode parse_target_mode(const std::string& name);

enum class InversionMethod : uint8_t {
    None = 0,        // Value was already a gross
    ClosedForm = 1,
    Bisection = 2
};

std::string to_string(InversionMethod method);

struct InversionResult {
    double gross;
    InversionMethod method;
    int iterations;            // Bisection evaluations (0 for closed form)
    int bracket_expansions;
    bool converged;            // False only when bisection ran out of iterations

    InversionResult();
};

// ============================================================================
// Employee inversion, one call per jurisdiction
// ============================================================================

// Gross monthly salary producing target_net. Closed form for Bulgaria,
// bisection for Estonia and Greece. Divergence is logged, not thrown.
double gross_for_net(Jurisdiction jurisdiction, double target_net, int payments_per_year);

// Gross monthly salary producing target_cost. Closed form everywhere:
// employer add-ons are flat-rate in every jurisdiction.
double gross_for_total_cost(Jurisdiction jurisdiction, double target_cost, int payments_per_year);

// ============================================================================
// Detailed inversion for any profile
// ============================================================================

InversionResult invert_for_net(Jurisdiction jurisdiction, EmploymentProfile profile,
                               double target_net, double expenses, int payments_per_year,
                               const SolverOptions& options = SolverOptions());

InversionResult invert_for_total_cost(Jurisdiction jurisdiction, EmploymentProfile profile,
                                      double target_cost, double expenses, int payments_per_year,
                                      const SolverOptions& options = SolverOptions());

// Always bisects the forward function, even where a closed form exists.
// Used to cross-check the closed forms.
InversionResult bisect_for_net(Jurisdiction jurisdiction, EmploymentProfile profile,
                               double target_net, double expenses, int payments_per_year,
                               const SolverOptions& options = SolverOptions());

InversionResult bisect_for_total_cost(Jurisdiction jurisdiction, EmploymentProfile profile,
                                      double target_cost, double expenses, int payments_per_year,
                                      const SolverOptions& options = SolverOptions());

// ============================================================================
// Idempotence check
// ============================================================================

struct RoundTripCheck {
    double achieved;           // Forward value at the resolved gross
    double error;              // |achieved - target|
    bool within_tolerance;
};

// Re-runs the forward rule at `gross` and compares the quantity selected
// by `mode` against `target`
RoundTripCheck verify_round_trip(Jurisdiction jurisdiction, EmploymentProfile profile,
                                 TargetMode mode, double target, double gross,
                                 double expenses, int payments_per_year,
                                 double tolerance = DEFAULT_TOLERANCE);

} // namespace paycalc

#endif // PAYCALC_INVERSION_HPP
