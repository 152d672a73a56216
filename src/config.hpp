#ifndef PAYCALC_CONFIG_HPP
#define PAYCALC_CONFIG_HPP

#include <string>
#include "errors.hpp"
#include "jurisdiction.hpp"
#include "logger.hpp"
#include "solver.hpp"

namespace paycalc {

/**
 * @brief Settings loaded from a JSON configuration file
 *
 * Every section and field is optional; missing fields keep their defaults.
 *
 * @code
 * {
 *   "defaults": { "country": "Greece", "profile": "Employee", "payments_per_year": 14 },
 *   "solver":   { "tolerance": 0.01, "max_iterations": 50, "max_bracket_expansions": 16 },
 *   "logging":  { "level": "INFO", "json": true, "file": "paycalc.log" }
 * }
 * @endcode
 */
struct CalculatorConfig {
    Jurisdiction jurisdiction;
    EmploymentProfile profile;
    int payments_per_year;           ///< 0 = jurisdiction default
    SolverOptions solver;
    LoggerConfig logging;

    CalculatorConfig();
};

/**
 * @brief Parses a configuration from a JSON file
 *
 * Relative log file paths are resolved against the config file's directory.
 *
 * @throws ConfigParseError if the file cannot be read or is invalid
 */
CalculatorConfig parse_config_from_file(const std::string& file_path);

/**
 * @brief Parses a configuration from a JSON string
 *
 * @throws ConfigParseError if the JSON is malformed or a value is invalid
 */
CalculatorConfig parse_config_from_string(const std::string& json_string);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a path relative to the directory containing config_file_path
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace paycalc

#endif // PAYCALC_CONFIG_HPP
