#ifndef PAYCALC_RULE_TABLE_HPP
#define PAYCALC_RULE_TABLE_HPP

#include <array>
#include "jurisdiction.hpp"
#include "tax_breakdown.hpp"

namespace paycalc {

using RuleFn = TaxBreakdown (*)(const CompensationInput&);

// RuleTable: (jurisdiction, profile) -> forward calculation.
// Built once on first use and never mutated afterwards.
class RuleTable {
public:
    static const RuleTable& instance();

    // Throws UnsupportedCombinationError when no rule is registered
    RuleFn lookup(Jurisdiction jurisdiction, EmploymentProfile profile) const;

    bool supports(Jurisdiction jurisdiction, EmploymentProfile profile) const;

    // Validates the input, then dispatches
    TaxBreakdown calculate(Jurisdiction jurisdiction, EmploymentProfile profile,
                           const CompensationInput& input) const;

private:
    RuleTable();

    std::array<std::array<RuleFn, PROFILE_COUNT>, JURISDICTION_COUNT> rules_;
};

// Forward calculation with the jurisdiction's default payment count
TaxBreakdown calculate(Jurisdiction jurisdiction, EmploymentProfile profile,
                       double income, double expenses = 0.0);

TaxBreakdown calculate(Jurisdiction jurisdiction, EmploymentProfile profile,
                       double income, double expenses, int payments_per_year);

} // namespace paycalc

#endif // PAYCALC_RULE_TABLE_HPP
