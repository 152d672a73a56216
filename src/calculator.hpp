#ifndef PAYCALC_CALCULATOR_HPP
#define PAYCALC_CALCULATOR_HPP

#include <string>
#include <vector>
#include "inversion.hpp"
#include "jurisdiction.hpp"
#include "solver.hpp"
#include "tax_breakdown.hpp"

namespace paycalc {

// What the caller asked for: a value interpreted according to `mode`
struct CalculationRequest {
    Jurisdiction jurisdiction;
    EmploymentProfile profile;
    TargetMode mode;
    double value;
    double expenses;
    int payments_per_year;    // 0 = jurisdiction default

    CalculationRequest();
    CalculationRequest(Jurisdiction j, EmploymentProfile p, TargetMode m, double v,
                       double exp = 0.0, int payments = 0);
};

// Resolved gross plus the forward breakdown recomputed from it
struct CalculationResult {
    CalculationRequest request;
    int payments_per_year;    // Effective payment count
    double gross;
    InversionResult inversion;
    TaxBreakdown breakdown;

    CalculationResult();
};

// Resolves requests: inverts net / total-cost targets to a gross, then
// always runs the forward rule on that gross so every breakdown line comes
// from the forward model
class Calculator {
public:
    Calculator();
    explicit Calculator(const SolverOptions& options);

    CalculationResult resolve(const CalculationRequest& request) const;

    // Same target resolved in every jurisdiction, in list_jurisdictions() order.
    // payments_per_year = 0 keeps each jurisdiction's default.
    std::vector<CalculationResult> compare(EmploymentProfile profile, TargetMode mode,
                                           double value, double expenses = 0.0,
                                           int payments_per_year = 0) const;

    const SolverOptions& options() const { return options_; }

private:
    SolverOptions options_;
};

int effective_payments(Jurisdiction jurisdiction, int payments_per_year);

} // namespace paycalc

#endif // PAYCALC_CALCULATOR_HPP
