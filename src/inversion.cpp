#include "inversion.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "rule_table.hpp"
#include "rules.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace paycalc {

// ============================================================================
// Names
// ============================================================================

std::string to_string(TargetMode mode) {
    switch (mode) {
        case TargetMode::Gross: return "gross";
        case TargetMode::Net: return "net";
        case TargetMode::TotalCost: return "total-cost";
    }
    return "unknown";
}

TargetMode parse_target_mode(const std::string& name) {
    std::string key;
    for (unsigned char c : name) {
        key.push_back(c == '_' ? '-' : static_cast<char>(std::tolower(c)));
    }
    if (key == "gross") return TargetMode::Gross;
    if (key == "net") return TargetMode::Net;
    if (key == "total-cost" || key == "cost" || key == "entire") return TargetMode::TotalCost;
    throw InvalidInputError("Unknown target mode: '" + name + "' (expected gross, net or total-cost)");
}

std::string to_string(InversionMethod method) {
    switch (method) {
        case InversionMethod::None: return "none";
        case InversionMethod::ClosedForm: return "closed-form";
        case InversionMethod::Bisection: return "bisection";
    }
    return "unknown";
}

InversionResult::InversionResult()
    : gross(0.0),
      method(InversionMethod::None),
      iterations(0),
      bracket_expansions(0),
      converged(true) {}

// ============================================================================
// Helpers
// ============================================================================

namespace {

void validate_target(const char* what, double target) {
    if (!std::isfinite(target) || target < 0.0) {
        throw InvalidInputError(std::string(what) + " must be a non-negative number, got " +
                                std::to_string(target));
    }
}

void validate_options(const SolverOptions& options) {
    if (!(options.tolerance > 0.0)) {
        throw InvalidInputError("Solver tolerance must be positive");
    }
    if (options.max_iterations < 1) {
        throw InvalidInputError("Solver max_iterations must be at least 1");
    }
    if (options.max_bracket_expansions < 0) {
        throw InvalidInputError("Solver max_bracket_expansions must not be negative");
    }
}

InversionResult closed_form(double gross) {
    InversionResult result;
    result.gross = gross;
    result.method = InversionMethod::ClosedForm;
    return result;
}

// Bisects one output of the forward rule with everything but gross held fixed.
// The search starts on [low, 2 * low] and grows upward until it brackets target.
template <typename Extract>
InversionResult bisect_forward(Jurisdiction jurisdiction, EmploymentProfile profile,
                               TargetMode mode, double target, double low,
                               double expenses, int payments_per_year,
                               const SolverOptions& options, Extract extract) {
    RuleFn rule = RuleTable::instance().lookup(jurisdiction, profile);
    CompensationInput input(0.0, expenses, payments_per_year);
    rules::validate_input(input);

    auto f = [rule, input, &extract](double gross) {
        CompensationInput at = input;
        at.monthly_gross = gross;
        return extract(rule(at));
    };

    Bracket bracket = expand_upper_bound(f, target, low, low * 2.0, options.max_bracket_expansions);
    SolveResult solved = bisect(f, target, bracket.low, bracket.high,
                                options.tolerance, options.max_iterations);

    InversionResult result;
    result.gross = solved.value;
    result.method = InversionMethod::Bisection;
    result.iterations = solved.iterations;
    result.bracket_expansions = bracket.expansions;
    result.converged = solved.converged;

    CalcContext ctx(to_string(jurisdiction), to_string(profile), payments_per_year);
    Logger& logger = Logger::get_instance();
    if (!solved.converged) {
        logger.log_divergence(ctx, to_string(mode), target, solved.value,
                              solved.iterations, solved.residual);
    }
    logger.log_inversion(ctx, to_string(mode), target, solved.value,
                         to_string(result.method), solved.iterations);
    return result;
}

// Smallest gross that can produce a given net: gross >= net always, and
// flat-rate profiles also need gross >= expenses + net
double net_search_floor(EmploymentProfile profile, double target_net, double expenses) {
    return profile == EmploymentProfile::Employee ? target_net : target_net + expenses;
}

} // anonymous namespace

// ============================================================================
// Bisection (any profile)
// ============================================================================

InversionResult bisect_for_net(Jurisdiction jurisdiction, EmploymentProfile profile,
                               double target_net, double expenses, int payments_per_year,
                               const SolverOptions& options) {
    validate_target("Target net", target_net);
    validate_options(options);
    return bisect_forward(jurisdiction, profile, TargetMode::Net, target_net,
                          net_search_floor(profile, target_net, expenses),
                          expenses, payments_per_year, options,
                          [](const TaxBreakdown& b) { return b.net; });
}

// total_cost >= gross, so the root lies below the target: search upward
// from half the target (every supported regime costs less than 2x gross).
// Flat-rate profiles are undefined below their expenses.
InversionResult bisect_for_total_cost(Jurisdiction jurisdiction, EmploymentProfile profile,
                                      double target_cost, double expenses, int payments_per_year,
                                      const SolverOptions& options) {
    validate_target("Target total cost", target_cost);
    validate_options(options);
    double search_floor = target_cost / 2.0;
    if (profile != EmploymentProfile::Employee) {
        search_floor = std::max(search_floor, expenses);
    }
    return bisect_forward(jurisdiction, profile, TargetMode::TotalCost, target_cost,
                          search_floor, expenses, payments_per_year, options,
                          [](const TaxBreakdown& b) { return b.total_cost; });
}

// ============================================================================
// Dispatch
// ============================================================================

InversionResult invert_for_net(Jurisdiction jurisdiction, EmploymentProfile profile,
                               double target_net, double expenses, int payments_per_year,
                               const SolverOptions& options) {
    validate_target("Target net", target_net);
    RuleTable::instance().lookup(jurisdiction, profile);

    if (profile != EmploymentProfile::Employee) {
        rules::validate_input(CompensationInput(0.0, expenses, payments_per_year));
        const double rate = rules::flat_rate(jurisdiction, profile);
        return closed_form(target_net / (1.0 - rate) + expenses);
    }

    switch (jurisdiction) {
        case Jurisdiction::Bulgaria:
            rules::validate_input(CompensationInput(0.0, expenses, payments_per_year));
            return closed_form(target_net / rules::bulgaria::NET_FACTOR);
        case Jurisdiction::Estonia:
        case Jurisdiction::Greece:
            return bisect_for_net(jurisdiction, profile, target_net, expenses,
                                  payments_per_year, options);
    }
    throw UnsupportedCombinationError("No net inversion for jurisdiction id " +
                                      std::to_string(static_cast<int>(jurisdiction)));
}

InversionResult invert_for_total_cost(Jurisdiction jurisdiction, EmploymentProfile profile,
                                      double target_cost, double expenses, int payments_per_year,
                                      const SolverOptions& options) {
    validate_target("Target total cost", target_cost);
    validate_options(options);
    RuleTable::instance().lookup(jurisdiction, profile);
    rules::validate_input(CompensationInput(0.0, expenses, payments_per_year));

    if (profile != EmploymentProfile::Employee) {
        return closed_form(target_cost);
    }

    switch (jurisdiction) {
        case Jurisdiction::Bulgaria:
            return closed_form(target_cost / rules::bulgaria::COST_FACTOR);
        case Jurisdiction::Estonia:
            return closed_form(target_cost / rules::estonia::COST_FACTOR);
        case Jurisdiction::Greece:
            return closed_form(target_cost / rules::greece::COST_FACTOR);
    }
    throw UnsupportedCombinationError("No cost inversion for jurisdiction id " +
                                      std::to_string(static_cast<int>(jurisdiction)));
}

double gross_for_net(Jurisdiction jurisdiction, double target_net, int payments_per_year) {
    return invert_for_net(jurisdiction, EmploymentProfile::Employee, target_net, 0.0,
                          payments_per_year).gross;
}

double gross_for_total_cost(Jurisdiction jurisdiction, double target_cost, int payments_per_year) {
    return invert_for_total_cost(jurisdiction, EmploymentProfile::Employee, target_cost, 0.0,
                                 payments_per_year).gross;
}

// ============================================================================
// Round trip
// ============================================================================

RoundTripCheck verify_round_trip(Jurisdiction jurisdiction, EmploymentProfile profile,
                                 TargetMode mode, double target, double gross,
                                 double expenses, int payments_per_year,
                                 double tolerance) {
    TaxBreakdown b = calculate(jurisdiction, profile, gross, expenses, payments_per_year);

    RoundTripCheck check;
    check.achieved = gross;
    switch (mode) {
        case TargetMode::Gross: break;
        case TargetMode::Net: check.achieved = b.net; break;
        case TargetMode::TotalCost: check.achieved = b.total_cost; break;
    }
    check.error = std::fabs(check.achieved - target);
    check.within_tolerance = check.error < tolerance;
    return check;
}

} // namespace paycalc
