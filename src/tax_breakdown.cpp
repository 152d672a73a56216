#include "tax_breakdown.hpp"
#include <algorithm>
#include <stdexcept>

namespace paycalc {

CompensationInput::CompensationInput()
    : monthly_gross(0.0), expenses(0.0), payments_per_year(12) {}

CompensationInput::CompensationInput(double gross, double exp, int payments)
    : monthly_gross(gross), expenses(exp), payments_per_year(payments) {}

TaxBreakdown::TaxBreakdown()
    : total_tax(0.0), net(0.0), total_cost(0.0) {}

void TaxBreakdown::add_line(const std::string& name, double value) {
    breakdown.emplace_back(name, value);
}

bool TaxBreakdown::has_line(const std::string& name) const {
    return std::any_of(breakdown.begin(), breakdown.end(),
                       [&name](const LineItem& item) { return item.first == name; });
}

double TaxBreakdown::line(const std::string& name) const {
    for (const auto& [item_name, value] : breakdown) {
        if (item_name == name) {
            return value;
        }
    }
    throw std::out_of_range("No breakdown line named '" + name + "'");
}

} // namespace paycalc
