#include "calculator.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "rule_table.hpp"

namespace paycalc {

CalculationRequest::CalculationRequest()
    : jurisdiction(Jurisdiction::Bulgaria),
      profile(EmploymentProfile::Employee),
      mode(TargetMode::Gross),
      value(0.0),
      expenses(0.0),
      payments_per_year(0) {}

CalculationRequest::CalculationRequest(Jurisdiction j, EmploymentProfile p, TargetMode m,
                                       double v, double exp, int payments)
    : jurisdiction(j),
      profile(p),
      mode(m),
      value(v),
      expenses(exp),
      payments_per_year(payments) {}

CalculationResult::CalculationResult()
    : payments_per_year(0), gross(0.0) {}

int effective_payments(Jurisdiction jurisdiction, int payments_per_year) {
    if (payments_per_year == 0) {
        return default_payments_per_year(jurisdiction);
    }
    if (payments_per_year < 0) {
        throw InvalidInputError("Payments per year must be at least 1, got " +
                                std::to_string(payments_per_year));
    }
    return payments_per_year;
}

Calculator::Calculator() : options_() {}

Calculator::Calculator(const SolverOptions& options) : options_(options) {}

CalculationResult Calculator::resolve(const CalculationRequest& request) const {
    const RuleTable& table = RuleTable::instance();
    table.lookup(request.jurisdiction, request.profile);

    CalculationResult result;
    result.request = request;
    result.payments_per_year = effective_payments(request.jurisdiction, request.payments_per_year);

    switch (request.mode) {
        case TargetMode::Gross:
            result.inversion.gross = request.value;
            break;
        case TargetMode::Net:
            result.inversion = invert_for_net(request.jurisdiction, request.profile, request.value,
                                              request.expenses, result.payments_per_year, options_);
            break;
        case TargetMode::TotalCost:
            result.inversion = invert_for_total_cost(request.jurisdiction, request.profile,
                                                     request.value, request.expenses,
                                                     result.payments_per_year, options_);
            break;
    }
    result.gross = result.inversion.gross;

    result.breakdown = table.calculate(
        request.jurisdiction, request.profile,
        CompensationInput(result.gross, request.expenses, result.payments_per_year));

    Logger::get_instance().log_calculation(
        CalcContext(to_string(request.jurisdiction), to_string(request.profile),
                    result.payments_per_year),
        to_string(request.mode), request.value, result.gross,
        result.breakdown.net, result.breakdown.total_cost);

    return result;
}

std::vector<CalculationResult> Calculator::compare(EmploymentProfile profile, TargetMode mode,
                                               double value, double expenses,
                                               int payments_per_year) const {
    std::vector<CalculationResult> results;
    for (Jurisdiction j : list_jurisdictions()) {
        results.push_back(resolve(CalculationRequest(j, profile, mode, value, expenses,
                                                     payments_per_year)));
    }
    return results;
}

} // namespace paycalc
