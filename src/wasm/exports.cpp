// WASM exports for PayCalc
// These functions provide a C-compatible interface for JavaScript interop

#include "exports.hpp"

#include <sstream>
#include <string>
#include <vector>

#include "../calculator.hpp"
#include "../io/json_writer.hpp"

using namespace paycalc;

// Module state. Persists across calls so returned pointers stay valid.
static std::string g_result_json;
static std::string g_last_error;
static std::string g_listing_json;

namespace {

int32_t fail(const std::string& message) {
    g_last_error = message;
    return -1;
}

} // anonymous namespace

// ============================================================================
// Calculation
// ============================================================================

PAYCALC_EXPORT
int32_t paycalc_calculate(const char* country, const char* profile, const char* mode,
                          double value, double expenses, int32_t payments) {
    if (!country || !profile || !mode) {
        return fail("country, profile and mode are required");
    }

    try {
        CalculationRequest request(parse_jurisdiction(country), parse_profile(profile),
                                   parse_target_mode(mode), value, expenses, payments);
        CalculationResult result = Calculator().resolve(request);

        std::ostringstream oss;
        io::write_result_json(oss, result, false);
        g_result_json = oss.str();
        g_last_error.clear();
        return 0;
    } catch (const std::exception& e) {
        return fail(e.what());
    }
}

PAYCALC_EXPORT
int32_t paycalc_compare(const char* profile, const char* mode, double value,
                        double expenses, int32_t payments) {
    if (!profile || !mode) {
        return fail("profile and mode are required");
    }

    try {
        std::vector<CalculationResult> results = Calculator().compare(
            parse_profile(profile), parse_target_mode(mode), value, expenses, payments);

        std::ostringstream oss;
        io::write_comparison_json(oss, results, false);
        g_result_json = oss.str();
        g_last_error.clear();
        return 0;
    } catch (const std::exception& e) {
        return fail(e.what());
    }
}

// ============================================================================
// Result access
// ============================================================================

PAYCALC_EXPORT
const char* paycalc_get_result_json() {
    return g_result_json.c_str();
}

PAYCALC_EXPORT
int32_t paycalc_get_result_length() {
    return static_cast<int32_t>(g_result_json.size());
}

PAYCALC_EXPORT
const char* paycalc_get_last_error() {
    return g_last_error.c_str();
}

PAYCALC_EXPORT
const char* paycalc_list_json() {
    if (g_listing_json.empty()) {
        std::ostringstream oss;
        io::write_listing_json(oss, false);
        g_listing_json = oss.str();
    }
    return g_listing_json.c_str();
}

PAYCALC_EXPORT
const char* paycalc_version() {
    return "1.0.0";
}
