#include "jurisdiction.hpp"
#include "errors.hpp"
#include <cctype>

namespace paycalc {

namespace {

// Lower-case and fold '-' / ' ' to '_' so "Small Business" == "small_business"
std::string normalize_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        if (c == '-' || c == ' ') {
            out.push_back('_');
        } else {
            out.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return out;
}

} // anonymous namespace

std::vector<Jurisdiction> list_jurisdictions() {
    return {Jurisdiction::Bulgaria, Jurisdiction::Estonia, Jurisdiction::Greece};
}

std::vector<EmploymentProfile> list_profiles() {
    return {EmploymentProfile::Employee, EmploymentProfile::SelfEmployed,
            EmploymentProfile::SmallBusiness};
}

std::string to_string(Jurisdiction jurisdiction) {
    switch (jurisdiction) {
        case Jurisdiction::Bulgaria: return "Bulgaria";
        case Jurisdiction::Estonia: return "Estonia";
        case Jurisdiction::Greece: return "Greece";
    }
    return "Unknown";
}

std::string to_string(EmploymentProfile profile) {
    switch (profile) {
        case EmploymentProfile::Employee: return "Employee";
        case EmploymentProfile::SelfEmployed: return "Self-Employed";
        case EmploymentProfile::SmallBusiness: return "Small Business";
    }
    return "Unknown";
}

Jurisdiction parse_jurisdiction(const std::string& name) {
    const std::string key = normalize_name(name);
    for (Jurisdiction j : list_jurisdictions()) {
        if (normalize_name(to_string(j)) == key) {
            return j;
        }
    }
    throw UnsupportedCombinationError("Unknown jurisdiction: '" + name + "'");
}

EmploymentProfile parse_profile(const std::string& name) {
    const std::string key = normalize_name(name);
    for (EmploymentProfile p : list_profiles()) {
        if (normalize_name(to_string(p)) == key) {
            return p;
        }
    }
    throw UnsupportedCombinationError("Unknown employment profile: '" + name + "'");
}

int default_payments_per_year(Jurisdiction jurisdiction) {
    switch (jurisdiction) {
        case Jurisdiction::Bulgaria: return 12;
        case Jurisdiction::Estonia: return 12;
        case Jurisdiction::Greece: return 14;
    }
    throw UnsupportedCombinationError("Unknown jurisdiction id: " +
                                      std::to_string(static_cast<int>(jurisdiction)));
}

bool is_valid(Jurisdiction jurisdiction) {
    return static_cast<size_t>(jurisdiction) < JURISDICTION_COUNT;
}

bool is_valid(EmploymentProfile profile) {
    return static_cast<size_t>(profile) < PROFILE_COUNT;
}

} // namespace paycalc
