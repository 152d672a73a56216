#ifndef PAYCALC_TAX_BREAKDOWN_HPP
#define PAYCALC_TAX_BREAKDOWN_HPP

#include <string>
#include <utility>
#include <vector>

namespace paycalc {

// Input to a forward calculation. All amounts are per salary payment.
struct CompensationInput {
    double monthly_gross;
    double expenses;
    int payments_per_year;

    CompensationInput();
    CompensationInput(double gross, double exp, int payments);
};

// Result of a forward calculation
//   net        = gross - employee-side deductions
//   total_cost = gross + employer-side contributions
//   total_tax  = employee-side tax and mandatory contributions (<= gross)
struct TaxBreakdown {
    using LineItem = std::pair<std::string, double>;

    double total_tax;
    double net;
    double total_cost;
    std::vector<LineItem> breakdown;  // Display order is insertion order

    TaxBreakdown();

    void add_line(const std::string& name, double value);

    bool has_line(const std::string& name) const;

    // Throws std::out_of_range if no line item has that name
    double line(const std::string& name) const;
};

} // namespace paycalc

#endif // PAYCALC_TAX_BREAKDOWN_HPP
