#include "rules.hpp"
#include "errors.hpp"
#include <cmath>
#include <string>

namespace paycalc {
namespace rules {

namespace {

constexpr std::array<TaxBand, 5> GREECE_INCOME_TAX_BANDS = {{
    {0.0, 0.09},
    {10000.0, 0.22},
    {20000.0, 0.28},
    {30000.0, 0.36},
    {40000.0, 0.44},
}};

constexpr std::array<TaxBand, 5> GREECE_SOLIDARITY_BANDS = {{
    {0.0, 0.0},
    {12000.0, 0.022},
    {20000.0, 0.05},
    {30000.0, 0.06},
    {40000.0, 0.08},
}};

// flat_rates[jurisdiction][profile - 1] for SelfEmployed, SmallBusiness
constexpr std::array<std::array<double, PROFILE_COUNT - 1>, JURISDICTION_COUNT> FLAT_RATES = {{
    {0.15, 0.12},  // Bulgaria
    {0.25, 0.20},  // Estonia
    {0.26, 0.24},  // Greece
}};

} // anonymous namespace

// ============================================================================
// Schedules
// ============================================================================

double greece_income_tax(double annual_taxable) {
    return progressive_amount(GREECE_INCOME_TAX_BANDS, annual_taxable);
}

double greece_solidarity(double annual_taxable) {
    return progressive_amount(GREECE_SOLIDARITY_BANDS, annual_taxable);
}

double estonia_annual_allowance(double annual_gross) {
    using namespace estonia;
    if (annual_gross <= PHASE_OUT_START) {
        return ANNUAL_ALLOWANCE;
    }
    if (annual_gross <= PHASE_OUT_END) {
        return ANNUAL_ALLOWANCE -
               ANNUAL_ALLOWANCE * ((annual_gross - PHASE_OUT_START) / (PHASE_OUT_END - PHASE_OUT_START));
    }
    return 0.0;
}

double flat_rate(Jurisdiction jurisdiction, EmploymentProfile profile) {
    if (!is_valid(jurisdiction) || !is_valid(profile) || profile == EmploymentProfile::Employee) {
        throw UnsupportedCombinationError(
            "No flat-rate rule for jurisdiction id " + std::to_string(static_cast<int>(jurisdiction)) +
            ", profile id " + std::to_string(static_cast<int>(profile)));
    }
    return FLAT_RATES[static_cast<size_t>(jurisdiction)][static_cast<size_t>(profile) - 1];
}

void validate_input(const CompensationInput& input) {
    if (!std::isfinite(input.monthly_gross) || input.monthly_gross < 0.0) {
        throw InvalidInputError("Gross income must be a non-negative number, got " +
                                std::to_string(input.monthly_gross));
    }
    if (!std::isfinite(input.expenses) || input.expenses < 0.0) {
        throw InvalidInputError("Expenses must be a non-negative number, got " +
                                std::to_string(input.expenses));
    }
    if (input.payments_per_year < 1) {
        throw InvalidInputError("Payments per year must be at least 1, got " +
                                std::to_string(input.payments_per_year));
    }
}

// ============================================================================
// Employee rules
// ============================================================================

TaxBreakdown bulgaria_employee(const CompensationInput& input) {
    using namespace bulgaria;
    const double gross = input.monthly_gross;

    const double social_employee = gross * EMPLOYEE_SOCIAL_RATE;
    const double taxable = gross - social_employee;
    const double income_tax = taxable * INCOME_TAX_RATE;
    const double net = gross - social_employee - income_tax;
    const double social_employer = gross * EMPLOYER_SOCIAL_RATE;
    const double total_cost = gross + social_employer;

    TaxBreakdown result;
    result.total_tax = social_employee + income_tax;
    result.net = net;
    result.total_cost = total_cost;
    result.add_line("Gross", gross);
    result.add_line("Employee Social Security (13.78%)", social_employee);
    result.add_line("Employer Social Security (19.18%)", social_employer);
    result.add_line("Taxable Income", taxable);
    result.add_line("Income Tax (10%)", income_tax);
    result.add_line("Net Salary", net);
    result.add_line("Entire Expense", total_cost);
    return result;
}

// Estonia always annualizes by 12 regardless of the payment count
TaxBreakdown estonia_employee(const CompensationInput& input) {
    using namespace estonia;
    const double gross = input.monthly_gross;

    const double pension = gross * PENSION_RATE;
    const double unemployment = gross * EMPLOYEE_UNEMPLOYMENT_RATE;
    const double annual_gross = gross * MONTHS_PER_YEAR;
    const double allowance = estonia_annual_allowance(annual_gross) / MONTHS_PER_YEAR;

    // Can go negative below the allowance; the tax is floored at zero instead
    const double taxable = gross - pension - unemployment - allowance;
    const double income_tax = std::max(0.0, taxable * INCOME_TAX_RATE);
    const double net = gross - pension - unemployment - income_tax;

    const double social_tax = gross * SOCIAL_TAX_RATE;
    const double unemployment_employer = gross * EMPLOYER_UNEMPLOYMENT_RATE;
    const double total_cost = gross + social_tax + unemployment_employer;

    TaxBreakdown result;
    result.total_tax = income_tax + pension + unemployment;
    result.net = net;
    result.total_cost = total_cost;
    result.add_line("Gross", gross);
    result.add_line("Pension (II pillar)", pension);
    result.add_line("Unemployment (Employee)", unemployment);
    result.add_line("Tax-free Allowance", allowance);
    result.add_line("Taxable Income", taxable);
    result.add_line("Income Tax (22%)", income_tax);
    result.add_line("Net Salary", net);
    result.add_line("Social Tax (Employer)", social_tax);
    result.add_line("Unemployment (Employer)", unemployment_employer);
    result.add_line("Entire Expense", total_cost);
    return result;
}

TaxBreakdown greece_employee(const CompensationInput& input) {
    using namespace greece;
    const double gross = input.monthly_gross;
    const double payments = static_cast<double>(input.payments_per_year);

    const double annual_gross = gross * payments;
    const double social_monthly = gross * EMPLOYEE_SOCIAL_RATE;
    const double social_annual = social_monthly * payments;
    const double annual_taxable = annual_gross - social_annual;

    const double income_tax = greece_income_tax(annual_taxable);
    const double solidarity = greece_solidarity(annual_taxable);

    const double net_annual = annual_gross - social_annual - income_tax - solidarity;
    const double net_monthly = net_annual / payments;

    const double employer_monthly = gross * EMPLOYER_SOCIAL_RATE;
    const double employer_annual = employer_monthly * payments;
    const double cost_annual = annual_gross + employer_annual;
    const double cost_monthly = cost_annual / payments;

    TaxBreakdown result;
    // Per payment, so it compares against the monthly gross
    result.total_tax = (social_annual + income_tax + solidarity) / payments;
    result.net = net_monthly;
    result.total_cost = cost_monthly;
    result.add_line("Gross (monthly)", gross);
    result.add_line("Gross (annual)", annual_gross);
    result.add_line("Employee Social Security (monthly)", social_monthly);
    result.add_line("Employee Social Security (annual)", social_annual);
    result.add_line("Employer Social Security (monthly)", employer_monthly);
    result.add_line("Employer Social Security (annual)", employer_annual);
    result.add_line("Taxable Income (annual)", annual_taxable);
    result.add_line("Income Tax (annual)", income_tax);
    result.add_line("Solidarity Contribution (annual)", solidarity);
    result.add_line("Net Salary (annual)", net_annual);
    result.add_line("Net Salary (monthly)", net_monthly);
    result.add_line("Entire Expense (annual)", cost_annual);
    result.add_line("Entire Expense (monthly)", cost_monthly);
    return result;
}

// ============================================================================
// Placeholder flat-rate profiles
// ============================================================================

TaxBreakdown flat_rate_profile(const CompensationInput& input, double rate) {
    if (input.expenses > input.monthly_gross) {
        throw InvalidInputError("Expenses (" + std::to_string(input.expenses) +
                                ") exceed income (" + std::to_string(input.monthly_gross) + ")");
    }
    const double taxable = input.monthly_gross - input.expenses;

    TaxBreakdown result;
    result.total_tax = taxable * rate;
    result.net = taxable * (1.0 - rate);
    result.total_cost = input.monthly_gross;
    result.add_line("Flat Tax", result.total_tax);
    result.add_line("Net", result.net);
    result.add_line("Entire Expense", result.total_cost);
    return result;
}

} // namespace rules
} // namespace paycalc
