#ifndef PAYCALC_RULES_HPP
#define PAYCALC_RULES_HPP

#include <algorithm>
#include <array>
#include <cstddef>
#include "jurisdiction.hpp"
#include "tax_breakdown.hpp"

namespace paycalc {
namespace rules {

// ============================================================================
// 2025 rate constants
// ============================================================================

namespace bulgaria {
constexpr double EMPLOYEE_SOCIAL_RATE = 0.1378;
constexpr double INCOME_TAX_RATE = 0.10;
constexpr double EMPLOYER_SOCIAL_RATE = 0.1918;

// net = gross * NET_FACTOR, total cost = gross * COST_FACTOR
constexpr double NET_FACTOR = (1.0 - EMPLOYEE_SOCIAL_RATE) * (1.0 - INCOME_TAX_RATE);
constexpr double COST_FACTOR = 1.0 + EMPLOYER_SOCIAL_RATE;
} // namespace bulgaria

namespace estonia {
constexpr double PENSION_RATE = 0.02;              // II pillar
constexpr double EMPLOYEE_UNEMPLOYMENT_RATE = 0.016;
constexpr double INCOME_TAX_RATE = 0.22;
constexpr double SOCIAL_TAX_RATE = 0.33;
constexpr double EMPLOYER_UNEMPLOYMENT_RATE = 0.008;

constexpr double MONTHLY_ALLOWANCE = 654.0;
constexpr double ANNUAL_ALLOWANCE = MONTHLY_ALLOWANCE * 12.0;   // 7848
constexpr double PHASE_OUT_START = 14400.0;                     // annual gross
constexpr double PHASE_OUT_END = 25200.0;
constexpr int MONTHS_PER_YEAR = 12;

constexpr double COST_FACTOR = 1.0 + SOCIAL_TAX_RATE + EMPLOYER_UNEMPLOYMENT_RATE;
} // namespace estonia

namespace greece {
constexpr double EMPLOYEE_SOCIAL_RATE = 0.1412;
constexpr double EMPLOYER_SOCIAL_RATE = 0.2229;

constexpr double COST_FACTOR = 1.0 + EMPLOYER_SOCIAL_RATE;
} // namespace greece

// ============================================================================
// Progressive schedules
// ============================================================================

// A band starts at `lower` and runs to the next band's lower bound;
// the last band is open-ended
struct TaxBand {
    double lower;
    double rate;
};

// Sum of rate * (portion of amount falling inside each band).
// Bands must be sorted by ascending lower bound.
template <size_t N>
double progressive_amount(const std::array<TaxBand, N>& bands, double amount) {
    double total = 0.0;
    for (size_t i = 0; i < N; ++i) {
        if (amount <= bands[i].lower) {
            break;
        }
        const double upper = (i + 1 < N) ? std::min(amount, bands[i + 1].lower) : amount;
        total += (upper - bands[i].lower) * bands[i].rate;
    }
    return total;
}

// Greek income tax on annual taxable income (5 bands: 9/22/28/36/44%)
double greece_income_tax(double annual_taxable);

// Greek solidarity contribution on annual taxable income (2.2/5/6/8% above 12000)
double greece_solidarity(double annual_taxable);

// Estonian annual tax-free allowance: full up to 14400, linear phase-out to 25200
double estonia_annual_allowance(double annual_gross);

// Provisional flat rate for a non-employee profile.
// Throws UnsupportedCombinationError for Employee or out-of-range values.
double flat_rate(Jurisdiction jurisdiction, EmploymentProfile profile);

// ============================================================================
// Forward rules. Inputs are assumed validated (see validate_input).
// ============================================================================

TaxBreakdown bulgaria_employee(const CompensationInput& input);
TaxBreakdown estonia_employee(const CompensationInput& input);
TaxBreakdown greece_employee(const CompensationInput& input);

// tax = (income - expenses) * rate, net = (income - expenses) * (1 - rate),
// total cost = income. Throws InvalidInputError if expenses exceed income.
TaxBreakdown flat_rate_profile(const CompensationInput& input, double rate);

template <Jurisdiction J, EmploymentProfile P>
TaxBreakdown flat_rate_rule(const CompensationInput& input) {
    return flat_rate_profile(input, flat_rate(J, P));
}

// Throws InvalidInputError for negative/non-finite amounts or payments < 1
void validate_input(const CompensationInput& input);

} // namespace rules
} // namespace paycalc

#endif // PAYCALC_RULES_HPP
