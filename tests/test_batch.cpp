#include <catch2/catch.hpp>
#include <sstream>
#include <string>
#include "batch.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"

using namespace paycalc;
using Catch::Matchers::WithinAbs;

#ifndef PAYCALC_TEST_DATA_DIR
#define PAYCALC_TEST_DATA_DIR "data"
#endif

namespace {

std::string data_path(const std::string& name) {
    return std::string(PAYCALC_TEST_DATA_DIR) + "/" + name;
}

} // anonymous namespace

// ============================================================================
// CSV reader
// ============================================================================

TEST_CASE("CsvReader trims cells and tracks lines", "[csv]") {
    std::istringstream input("a, b ,c\r\n\n1,2,\n");
    CsvReader reader(input);

    auto first = reader.read_row();
    REQUIRE(first == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(reader.line_number() == 1);

    auto blank = reader.read_row();
    REQUIRE(blank.empty());
    REQUIRE(reader.line_number() == 2);

    auto last = reader.read_row();
    REQUIRE(last == std::vector<std::string>{"1", "2", ""});
    REQUIRE(reader.line_number() == 3);
    REQUIRE_FALSE(reader.has_more());
}

TEST_CASE("CsvReader honors a custom delimiter", "[csv]") {
    std::istringstream input("x;y\n");
    CsvReader reader(input, ';');
    REQUIRE(reader.read_row() == std::vector<std::string>{"x", "y"});
}

// ============================================================================
// Loading
// ============================================================================

TEST_CASE("Batch rows are parsed by header name", "[batch]") {
    std::istringstream input(
        "value,mode,profile,country,payments\n"
        "1500,net,Employee,Greece,12\n"
        "900,gross,self-employed,bulgaria,\n");

    auto rows = load_batch_csv(input);
    REQUIRE(rows.size() == 2);

    REQUIRE(rows[0].line == 2);
    REQUIRE(rows[0].parse_error.empty());
    REQUIRE(rows[0].request.jurisdiction == Jurisdiction::Greece);
    REQUIRE(rows[0].request.mode == TargetMode::Net);
    REQUIRE(rows[0].request.value == 1500.0);
    REQUIRE(rows[0].request.payments_per_year == 12);

    REQUIRE(rows[1].request.profile == EmploymentProfile::SelfEmployed);
    REQUIRE(rows[1].request.expenses == 0.0);
    REQUIRE(rows[1].request.payments_per_year == 0);
}

TEST_CASE("Malformed rows keep their error", "[batch]") {
    std::istringstream input(
        "country,profile,mode,value\n"
        "Bulgaria,Employee,gross,12abc\n"
        "Bulgaria,Employee,take-home,1000\n"
        "Narnia,Employee,gross,1000\n");

    auto rows = load_batch_csv(input);
    REQUIRE(rows.size() == 3);
    REQUIRE(rows[0].parse_error.find("not a number") != std::string::npos);
    REQUIRE(rows[1].parse_error.find("Unknown target mode") != std::string::npos);
    REQUIRE(rows[2].parse_error.find("Unknown jurisdiction") != std::string::npos);
}

TEST_CASE("Batch header must name the required columns", "[batch]") {
    std::istringstream input("country,mode,value\nBulgaria,gross,1000\n");
    REQUIRE_THROWS_AS(load_batch_csv(input), InvalidInputError);

    REQUIRE_THROWS_AS(load_batch_csv(data_path("bad_header.csv")), InvalidInputError);

    std::istringstream empty("");
    REQUIRE_THROWS_AS(load_batch_csv(empty), InvalidInputError);
}

TEST_CASE("Missing batch file", "[batch]") {
    REQUIRE_THROWS_AS(load_batch_csv(std::string("/nonexistent/batch.csv")), InvalidInputError);
}

// ============================================================================
// Running
// ============================================================================

TEST_CASE("Sample batch resolves valid rows and reports bad ones", "[batch]") {
    auto rows = load_batch_csv(data_path("sample_batch.csv"));
    REQUIRE(rows.size() == 8);

    Calculator calculator;
    BatchResult batch = run_batch(rows, calculator);

    REQUIRE(batch.entries.size() == 8);
    REQUIRE(batch.error_count() == 2);
    REQUIRE(batch.execution_time_ms >= 0.0);

    // Results stay in input order
    REQUIRE(batch.entries[0].line == 2);
    REQUIRE(batch.entries[0].ok);
    REQUIRE_THAT(batch.entries[0].result.breakdown.net, WithinAbs(775.98, 1e-9));

    REQUIRE(batch.entries[1].ok);
    REQUIRE_THAT(batch.entries[1].result.breakdown.net, WithinAbs(1500.0, 0.01));

    REQUIRE(batch.entries[2].ok);
    REQUIRE(batch.entries[2].result.payments_per_year == 14);
    REQUIRE_THAT(batch.entries[2].result.breakdown.net, WithinAbs(1200.0, 0.01));

    REQUIRE(batch.entries[3].ok);
    REQUIRE_THAT(batch.entries[3].result.gross, WithinAbs(2000.0, 1e-9));

    REQUIRE(batch.entries[4].ok);
    REQUIRE_THAT(batch.entries[4].result.breakdown.net, WithinAbs(1275.0, 1e-9));

    REQUIRE(batch.entries[5].ok);
    REQUIRE_THAT(batch.entries[5].result.gross, WithinAbs(1100.0, 1e-9));

    // Line 8 is blank
    REQUIRE(batch.entries[6].line == 9);
    REQUIRE_FALSE(batch.entries[6].ok);
    REQUIRE(batch.entries[6].error.find("Atlantis") != std::string::npos);

    REQUIRE(batch.entries[7].line == 10);
    REQUIRE_FALSE(batch.entries[7].ok);
    REQUIRE(batch.entries[7].error.find("non-negative") != std::string::npos);
}

TEST_CASE("Batch results match individual resolution", "[batch][parallel]") {
    std::ostringstream csv;
    csv << "country,profile,mode,value\n";
    for (int i = 0; i < 200; ++i) {
        const char* country = (i % 3 == 0) ? "Bulgaria" : (i % 3 == 1) ? "Estonia" : "Greece";
        csv << country << ",Employee,net," << (500 + i * 37) << "\n";
    }
    std::istringstream input(csv.str());
    auto rows = load_batch_csv(input);

    Calculator calculator;
    BatchResult batch = run_batch(rows, calculator);
    REQUIRE(batch.error_count() == 0);

    for (size_t i = 0; i < rows.size(); ++i) {
        CalculationResult single = calculator.resolve(rows[i].request);
        REQUIRE(batch.entries[i].result.gross == single.gross);
    }
}

TEST_CASE("Failures raised while resolving stay on their row", "[batch][parallel]") {
    std::vector<BatchRow> rows(64);
    for (size_t i = 0; i < rows.size(); ++i) {
        rows[i].line = i + 2;
        rows[i].request = CalculationRequest(Jurisdiction::Bulgaria, EmploymentProfile::Employee,
                                             TargetMode::Gross, 1000.0);
    }
    rows[10].request.jurisdiction = static_cast<Jurisdiction>(9);
    rows[20].request.payments_per_year = -3;
    rows[30].request.mode = TargetMode::Net;
    rows[30].request.value = -1.0;

    BatchResult batch = run_batch(rows, Calculator());

    REQUIRE(batch.entries.size() == rows.size());
    REQUIRE(batch.error_count() == 3);
    REQUIRE(batch.entries[10].error.find("Unsupported combination") != std::string::npos);
    REQUIRE(batch.entries[20].error.find("Payments per year") != std::string::npos);
    REQUIRE(batch.entries[30].error.find("Target net") != std::string::npos);
    REQUIRE(batch.entries[11].ok);
    REQUIRE(batch.entries[11].line == 13);
}

TEST_CASE("Empty batch", "[batch]") {
    std::istringstream input("country,profile,mode,value\n");
    auto rows = load_batch_csv(input);
    REQUIRE(rows.empty());

    BatchResult batch = run_batch(rows, Calculator());
    REQUIRE(batch.entries.empty());
    REQUIRE(batch.error_count() == 0);
}
