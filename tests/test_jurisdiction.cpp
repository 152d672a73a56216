#include <catch2/catch.hpp>
#include "jurisdiction.hpp"
#include "errors.hpp"

using namespace paycalc;

TEST_CASE("Jurisdictions are listed in display order", "[jurisdiction]") {
    auto all = list_jurisdictions();
    REQUIRE(all.size() == JURISDICTION_COUNT);
    REQUIRE(all[0] == Jurisdiction::Bulgaria);
    REQUIRE(all[1] == Jurisdiction::Estonia);
    REQUIRE(all[2] == Jurisdiction::Greece);
}

TEST_CASE("Profiles are listed in display order", "[jurisdiction]") {
    auto all = list_profiles();
    REQUIRE(all.size() == PROFILE_COUNT);
    REQUIRE(all[0] == EmploymentProfile::Employee);
    REQUIRE(all[1] == EmploymentProfile::SelfEmployed);
    REQUIRE(all[2] == EmploymentProfile::SmallBusiness);
}

TEST_CASE("Display names", "[jurisdiction]") {
    REQUIRE(to_string(Jurisdiction::Estonia) == "Estonia");
    REQUIRE(to_string(EmploymentProfile::SelfEmployed) == "Self-Employed");
    REQUIRE(to_string(EmploymentProfile::SmallBusiness) == "Small Business");
}

TEST_CASE("Name parsing", "[jurisdiction]") {
    SECTION("Jurisdictions are case-insensitive") {
        REQUIRE(parse_jurisdiction("greece") == Jurisdiction::Greece);
        REQUIRE(parse_jurisdiction("BULGARIA") == Jurisdiction::Bulgaria);
    }

    SECTION("Profiles accept display and snake-case names") {
        REQUIRE(parse_profile("Self-Employed") == EmploymentProfile::SelfEmployed);
        REQUIRE(parse_profile("self_employed") == EmploymentProfile::SelfEmployed);
        REQUIRE(parse_profile("Small Business") == EmploymentProfile::SmallBusiness);
        REQUIRE(parse_profile("small-business") == EmploymentProfile::SmallBusiness);
        REQUIRE(parse_profile("employee") == EmploymentProfile::Employee);
    }

    SECTION("Unknown names are unsupported") {
        REQUIRE_THROWS_AS(parse_jurisdiction("Atlantis"), UnsupportedCombinationError);
        REQUIRE_THROWS_AS(parse_profile("Freelancer"), UnsupportedCombinationError);
    }

    SECTION("Round trip through display names") {
        for (Jurisdiction j : list_jurisdictions()) {
            REQUIRE(parse_jurisdiction(to_string(j)) == j);
        }
        for (EmploymentProfile p : list_profiles()) {
            REQUIRE(parse_profile(to_string(p)) == p);
        }
    }
}

TEST_CASE("Default payments per year", "[jurisdiction]") {
    REQUIRE(default_payments_per_year(Jurisdiction::Bulgaria) == 12);
    REQUIRE(default_payments_per_year(Jurisdiction::Estonia) == 12);
    REQUIRE(default_payments_per_year(Jurisdiction::Greece) == 14);
    REQUIRE_THROWS_AS(default_payments_per_year(static_cast<Jurisdiction>(9)),
                      UnsupportedCombinationError);
}

TEST_CASE("Enum validity", "[jurisdiction]") {
    REQUIRE(is_valid(Jurisdiction::Greece));
    REQUIRE_FALSE(is_valid(static_cast<Jurisdiction>(3)));
    REQUIRE(is_valid(EmploymentProfile::SmallBusiness));
    REQUIRE_FALSE(is_valid(static_cast<EmploymentProfile>(200)));
}
