#ifndef PAYCALC_JURISDICTION_HPP
#define PAYCALC_JURISDICTION_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace paycalc {

enum class Jurisdiction : uint8_t {
    Bulgaria = 0,
    Estonia = 1,
    Greece = 2
};

enum class EmploymentProfile : uint8_t {
    Employee = 0,
    SelfEmployed = 1,
    SmallBusiness = 2
};

// Number of enumerators; the rule table is sized from these
constexpr size_t JURISDICTION_COUNT = 3;
constexpr size_t PROFILE_COUNT = 3;

// Supported jurisdictions and profiles in display order
std::vector<Jurisdiction> list_jurisdictions();
std::vector<EmploymentProfile> list_profiles();

std::string to_string(Jurisdiction jurisdiction);
std::string to_string(EmploymentProfile profile);

// Case-insensitive. Profiles accept "Self-Employed" as well as "self_employed".
// Throws UnsupportedCombinationError for unknown names.
Jurisdiction parse_jurisdiction(const std::string& name);
EmploymentProfile parse_profile(const std::string& name);

// Salary payments per year when the caller does not provide one
// (Greece pays 14 salaries, everyone else 12)
int default_payments_per_year(Jurisdiction jurisdiction);

bool is_valid(Jurisdiction jurisdiction);
bool is_valid(EmploymentProfile profile);

} // namespace paycalc

#endif // PAYCALC_JURISDICTION_HPP
