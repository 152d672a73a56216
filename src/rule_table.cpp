#include "rule_table.hpp"
#include "errors.hpp"
#include "rules.hpp"
#include <string>

namespace paycalc {

namespace {

// One switch per axis without a default label, so a new enumerator
// without a rule is a -Wswitch diagnostic rather than a silent gap
template <Jurisdiction J>
RuleFn rule_for_profile(EmploymentProfile profile) {
    switch (profile) {
        case EmploymentProfile::Employee:
            switch (J) {
                case Jurisdiction::Bulgaria: return &rules::bulgaria_employee;
                case Jurisdiction::Estonia: return &rules::estonia_employee;
                case Jurisdiction::Greece: return &rules::greece_employee;
            }
            return nullptr;
        case EmploymentProfile::SelfEmployed:
            return &rules::flat_rate_rule<J, EmploymentProfile::SelfEmployed>;
        case EmploymentProfile::SmallBusiness:
            return &rules::flat_rate_rule<J, EmploymentProfile::SmallBusiness>;
    }
    return nullptr;
}

RuleFn rule_for(Jurisdiction jurisdiction, EmploymentProfile profile) {
    switch (jurisdiction) {
        case Jurisdiction::Bulgaria: return rule_for_profile<Jurisdiction::Bulgaria>(profile);
        case Jurisdiction::Estonia: return rule_for_profile<Jurisdiction::Estonia>(profile);
        case Jurisdiction::Greece: return rule_for_profile<Jurisdiction::Greece>(profile);
    }
    return nullptr;
}

std::string describe(Jurisdiction jurisdiction, EmploymentProfile profile) {
    std::string j = is_valid(jurisdiction) ? to_string(jurisdiction)
                                           : "id " + std::to_string(static_cast<int>(jurisdiction));
    std::string p = is_valid(profile) ? to_string(profile)
                                      : "id " + std::to_string(static_cast<int>(profile));
    return j + " / " + p;
}

} // anonymous namespace

RuleTable::RuleTable() : rules_{} {
    for (Jurisdiction j : list_jurisdictions()) {
        for (EmploymentProfile p : list_profiles()) {
            rules_[static_cast<size_t>(j)][static_cast<size_t>(p)] = rule_for(j, p);
        }
    }
}

const RuleTable& RuleTable::instance() {
    static const RuleTable table;
    return table;
}

bool RuleTable::supports(Jurisdiction jurisdiction, EmploymentProfile profile) const {
    return is_valid(jurisdiction) && is_valid(profile) &&
           rules_[static_cast<size_t>(jurisdiction)][static_cast<size_t>(profile)] != nullptr;
}

RuleFn RuleTable::lookup(Jurisdiction jurisdiction, EmploymentProfile profile) const {
    if (!supports(jurisdiction, profile)) {
        throw UnsupportedCombinationError("Unsupported combination: " +
                                          describe(jurisdiction, profile));
    }
    return rules_[static_cast<size_t>(jurisdiction)][static_cast<size_t>(profile)];
}

TaxBreakdown RuleTable::calculate(Jurisdiction jurisdiction, EmploymentProfile profile,
                                  const CompensationInput& input) const {
    RuleFn rule = lookup(jurisdiction, profile);
    rules::validate_input(input);
    return rule(input);
}

TaxBreakdown calculate(Jurisdiction jurisdiction, EmploymentProfile profile,
                       double income, double expenses) {
    if (!is_valid(jurisdiction)) {
        throw UnsupportedCombinationError("Unsupported combination: " +
                                          describe(jurisdiction, profile));
    }
    return calculate(jurisdiction, profile, income, expenses,
                     default_payments_per_year(jurisdiction));
}

TaxBreakdown calculate(Jurisdiction jurisdiction, EmploymentProfile profile,
                       double income, double expenses, int payments_per_year) {
    return RuleTable::instance().calculate(
        jurisdiction, profile, CompensationInput(income, expenses, payments_per_year));
}

} // namespace paycalc
