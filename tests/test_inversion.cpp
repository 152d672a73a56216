#include <catch2/catch.hpp>
#include <limits>
#include "inversion.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "rule_table.hpp"
#include "rules.hpp"

using namespace paycalc;
using Catch::Matchers::WithinAbs;

namespace {

double net_at(Jurisdiction j, double gross, int payments) {
    return calculate(j, EmploymentProfile::Employee, gross, 0.0, payments).net;
}

SolverOptions tight_options() {
    SolverOptions options;
    options.tolerance = 1e-9;
    options.max_iterations = 200;
    return options;
}

// Keeps expected WARN events off the test output
struct QuietLogger {
    QuietLogger() {
        LoggerConfig config;
        config.enable_console = false;
        Logger::get_instance().configure(config);
    }
    ~QuietLogger() {
        Logger::get_instance().configure(LoggerConfig());
    }
};

} // anonymous namespace

// ============================================================================
// Target modes
// ============================================================================

TEST_CASE("Target mode names", "[inversion]") {
    REQUIRE(to_string(TargetMode::Gross) == "gross");
    REQUIRE(to_string(TargetMode::Net) == "net");
    REQUIRE(to_string(TargetMode::TotalCost) == "total-cost");

    REQUIRE(parse_target_mode("NET") == TargetMode::Net);
    REQUIRE(parse_target_mode("total_cost") == TargetMode::TotalCost);
    REQUIRE(parse_target_mode("total-cost") == TargetMode::TotalCost);
    REQUIRE(parse_target_mode("entire") == TargetMode::TotalCost);
    REQUIRE(parse_target_mode("cost") == TargetMode::TotalCost);
    REQUIRE_THROWS_AS(parse_target_mode("take-home"), InvalidInputError);
}

// ============================================================================
// Net inversion
// ============================================================================

TEST_CASE("Bulgaria net inversion is closed form", "[inversion][bulgaria]") {
    REQUIRE_THAT(gross_for_net(Jurisdiction::Bulgaria, 775.98, 12), WithinAbs(1000.0, 1e-9));

    InversionResult r = invert_for_net(Jurisdiction::Bulgaria, EmploymentProfile::Employee,
                                       775.98, 0.0, 12);
    REQUIRE(r.method == InversionMethod::ClosedForm);
    REQUIRE(r.iterations == 0);
    REQUIRE(r.converged);
}

TEST_CASE("Bulgaria closed form agrees with bisection", "[inversion][bulgaria]") {
    for (double target : {0.01, 500.0, 775.98, 3210.55, 99999.0}) {
        double closed = gross_for_net(Jurisdiction::Bulgaria, target, 12);
        InversionResult bisected = bisect_for_net(Jurisdiction::Bulgaria, EmploymentProfile::Employee,
                                                  target, 0.0, 12, tight_options());
        REQUIRE(bisected.method == InversionMethod::Bisection);
        REQUIRE(bisected.converged);
        REQUIRE_THAT(bisected.gross, WithinAbs(closed, 1e-8));
    }
}

TEST_CASE("Estonia net inversion bisects", "[inversion][estonia]") {
    SECTION("At the lower phase-out threshold") {
        InversionResult r = invert_for_net(Jurisdiction::Estonia, EmploymentProfile::Employee,
                                           1046.184, 0.0, 12);
        REQUIRE(r.method == InversionMethod::Bisection);
        REQUIRE(r.converged);
        REQUIRE(r.iterations > 0);
        REQUIRE_THAT(r.gross, WithinAbs(1200.0, 0.05));
        REQUIRE_THAT(net_at(Jurisdiction::Estonia, r.gross, 12), WithinAbs(1046.184, 0.01));
    }

    SECTION("Below the allowance") {
        double gross = gross_for_net(Jurisdiction::Estonia, 482.0, 12);
        REQUIRE_THAT(gross, WithinAbs(500.0, 0.05));
    }

    SECTION("Above the phase-out") {
        double gross = gross_for_net(Jurisdiction::Estonia, 1654.224, 12);
        REQUIRE_THAT(gross, WithinAbs(2200.0, 0.05));
    }
}

TEST_CASE("Greece net inversion bisects", "[inversion][greece]") {
    double target = net_at(Jurisdiction::Greece, 1000.0, 14);
    double gross = gross_for_net(Jurisdiction::Greece, target, 14);

    REQUIRE_THAT(gross, WithinAbs(1000.0, 0.05));
    REQUIRE_THAT(net_at(Jurisdiction::Greece, gross, 14), WithinAbs(target, 0.01));
}

TEST_CASE("Greece inversion depends on the payment count", "[inversion][greece]") {
    double twelve = gross_for_net(Jurisdiction::Greece, 1500.0, 12);
    double fourteen = gross_for_net(Jurisdiction::Greece, 1500.0, 14);
    REQUIRE(twelve != fourteen);
    REQUIRE_THAT(net_at(Jurisdiction::Greece, twelve, 12), WithinAbs(1500.0, 0.01));
    REQUIRE_THAT(net_at(Jurisdiction::Greece, fourteen, 14), WithinAbs(1500.0, 0.01));
}

TEST_CASE("High targets expand the search bracket", "[inversion][greece]") {
    InversionResult r = invert_for_net(Jurisdiction::Greece, EmploymentProfile::Employee,
                                       100000.0, 0.0, 14);
    REQUIRE(r.bracket_expansions > 0);
    REQUIRE(r.converged);
    REQUIRE_THAT(net_at(Jurisdiction::Greece, r.gross, 14), WithinAbs(100000.0, 0.01));
}

TEST_CASE("Zero net target resolves to zero gross", "[inversion]") {
    for (Jurisdiction j : list_jurisdictions()) {
        REQUIRE_THAT(gross_for_net(j, 0.0, default_payments_per_year(j)), WithinAbs(0.0, 1e-9));
    }
}

TEST_CASE("Exhausted iterations return a best-effort gross", "[inversion]") {
    QuietLogger quiet;
    SolverOptions options;
    options.max_iterations = 1;

    // Bracket [1500, 3000]: one midpoint, nowhere near the target
    InversionResult r = invert_for_net(Jurisdiction::Estonia, EmploymentProfile::Employee,
                                       1500.0, 0.0, 12, options);
    REQUIRE_FALSE(r.converged);
    REQUIRE(r.iterations == 1);
    REQUIRE(r.gross == 2250.0);
}

TEST_CASE("Flat-rate net inversion", "[inversion][flat]") {
    InversionResult r = invert_for_net(Jurisdiction::Bulgaria, EmploymentProfile::SelfEmployed,
                                       680.0, 200.0, 12);
    REQUIRE(r.method == InversionMethod::ClosedForm);
    REQUIRE_THAT(r.gross, WithinAbs(1000.0, 1e-9));

    InversionResult bisected = bisect_for_net(Jurisdiction::Bulgaria, EmploymentProfile::SelfEmployed,
                                              680.0, 200.0, 12, tight_options());
    REQUIRE_THAT(bisected.gross, WithinAbs(1000.0, 1e-8));
}

// ============================================================================
// Total-cost inversion
// ============================================================================

TEST_CASE("Total-cost inversion is closed form everywhere", "[inversion]") {
    REQUIRE_THAT(gross_for_total_cost(Jurisdiction::Bulgaria, 1191.8, 12), WithinAbs(1000.0, 1e-9));
    REQUIRE_THAT(gross_for_total_cost(Jurisdiction::Estonia, 1605.6, 12), WithinAbs(1200.0, 1e-9));
    REQUIRE_THAT(gross_for_total_cost(Jurisdiction::Greece, 1222.9, 14), WithinAbs(1000.0, 1e-9));

    InversionResult r = invert_for_total_cost(Jurisdiction::Greece, EmploymentProfile::Employee,
                                              2445.8, 0.0, 12);
    REQUIRE(r.method == InversionMethod::ClosedForm);
    REQUIRE_THAT(r.gross, WithinAbs(2000.0, 1e-9));
}

TEST_CASE("Total-cost closed forms agree with bisection", "[inversion]") {
    for (Jurisdiction j : list_jurisdictions()) {
        const int payments = default_payments_per_year(j);
        double closed = gross_for_total_cost(j, 4321.0, payments);
        InversionResult bisected = bisect_for_total_cost(j, EmploymentProfile::Employee, 4321.0, 0.0,
                                                         payments, tight_options());
        REQUIRE(bisected.converged);
        REQUIRE_THAT(bisected.gross, WithinAbs(closed, 1e-8));
    }
}

TEST_CASE("Flat-rate total cost equals income", "[inversion][flat]") {
    InversionResult r = invert_for_total_cost(Jurisdiction::Estonia, EmploymentProfile::SmallBusiness,
                                              1800.0, 300.0, 12);
    REQUIRE(r.gross == 1800.0);
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("Invalid targets are rejected", "[inversion]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();

    REQUIRE_THROWS_AS(gross_for_net(Jurisdiction::Estonia, -1.0, 12), InvalidInputError);
    REQUIRE_THROWS_AS(gross_for_net(Jurisdiction::Bulgaria, nan, 12), InvalidInputError);
    REQUIRE_THROWS_AS(gross_for_total_cost(Jurisdiction::Greece, -0.5, 14), InvalidInputError);
    REQUIRE_THROWS_AS(gross_for_net(Jurisdiction::Greece, 1000.0, 0), InvalidInputError);
    REQUIRE_THROWS_AS(gross_for_net(static_cast<Jurisdiction>(4), 1000.0, 12),
                      UnsupportedCombinationError);
}

TEST_CASE("Invalid solver options are rejected", "[inversion]") {
    SolverOptions options;
    options.tolerance = 0.0;
    REQUIRE_THROWS_AS(invert_for_net(Jurisdiction::Estonia, EmploymentProfile::Employee,
                                     1000.0, 0.0, 12, options),
                      InvalidInputError);

    options = SolverOptions();
    options.max_iterations = 0;
    REQUIRE_THROWS_AS(bisect_for_total_cost(Jurisdiction::Greece, EmploymentProfile::Employee,
                                            1000.0, 0.0, 14, options),
                      InvalidInputError);
}

// ============================================================================
// Round trip
// ============================================================================

TEST_CASE("verify_round_trip", "[inversion]") {
    RoundTripCheck ok = verify_round_trip(Jurisdiction::Bulgaria, EmploymentProfile::Employee,
                                          TargetMode::Net, 775.98, 1000.0, 0.0, 12);
    REQUIRE(ok.within_tolerance);
    REQUIRE_THAT(ok.achieved, WithinAbs(775.98, 1e-9));

    RoundTripCheck off = verify_round_trip(Jurisdiction::Bulgaria, EmploymentProfile::Employee,
                                           TargetMode::TotalCost, 1200.0, 1000.0, 0.0, 12);
    REQUIRE_FALSE(off.within_tolerance);
    REQUIRE_THAT(off.error, WithinAbs(8.2, 1e-9));

    RoundTripCheck gross = verify_round_trip(Jurisdiction::Greece, EmploymentProfile::Employee,
                                             TargetMode::Gross, 1000.0, 1000.0, 0.0, 14);
    REQUIRE(gross.within_tolerance);
    REQUIRE(gross.error == 0.0);
}
