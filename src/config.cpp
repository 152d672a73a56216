#include "config.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace paycalc {

CalculatorConfig::CalculatorConfig()
    : jurisdiction(Jurisdiction::Bulgaria),
      profile(EmploymentProfile::Employee),
      payments_per_year(0) {}

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++;
        }

        // A lone '$' is kept as-is
        if (var_name.empty()) {
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

namespace {

// Sections are objects; contains() on anything else quietly reports false
const json& require_object(const json& parent, const char* name) {
    const json& section = parent.at(name);
    if (!section.is_object()) {
        throw ConfigParseError(std::string(name) + " must be an object");
    }
    return section;
}

void parse_defaults(const json& defaults, CalculatorConfig& config) {
    if (defaults.contains("country")) {
        std::string name = expand_environment_variables(defaults["country"].get<std::string>());
        try {
            config.jurisdiction = parse_jurisdiction(name);
        } catch (const UnsupportedCombinationError& e) {
            throw ConfigParseError(std::string("defaults.country: ") + e.what());
        }
    }
    if (defaults.contains("profile")) {
        std::string name = expand_environment_variables(defaults["profile"].get<std::string>());
        try {
            config.profile = parse_profile(name);
        } catch (const UnsupportedCombinationError& e) {
            throw ConfigParseError(std::string("defaults.profile: ") + e.what());
        }
    }
    if (defaults.contains("payments_per_year")) {
        config.payments_per_year = defaults["payments_per_year"].get<int>();
        if (config.payments_per_year < 1) {
            throw ConfigParseError("defaults.payments_per_year must be at least 1");
        }
    }
}

void parse_solver(const json& solver, SolverOptions& options) {
    if (solver.contains("tolerance")) {
        options.tolerance = solver["tolerance"].get<double>();
        if (!(options.tolerance > 0.0)) {
            throw ConfigParseError("solver.tolerance must be positive");
        }
    }
    if (solver.contains("max_iterations")) {
        options.max_iterations = solver["max_iterations"].get<int>();
        if (options.max_iterations < 1) {
            throw ConfigParseError("solver.max_iterations must be at least 1");
        }
    }
    if (solver.contains("max_bracket_expansions")) {
        options.max_bracket_expansions = solver["max_bracket_expansions"].get<int>();
        if (options.max_bracket_expansions < 0) {
            throw ConfigParseError("solver.max_bracket_expansions must not be negative");
        }
    }
}

void parse_logging(const json& logging, LoggerConfig& config) {
    if (logging.contains("level")) {
        std::string level = logging["level"].get<std::string>();
        if (level != "DEBUG" && level != "INFO" && level != "WARN" && level != "ERROR") {
            throw ConfigParseError("logging.level must be one of DEBUG, INFO, WARN, ERROR");
        }
        config.min_level = string_to_level(level);
    }
    if (logging.contains("json")) {
        config.enable_json = logging["json"].get<bool>();
    }
    if (logging.contains("console")) {
        config.enable_console = logging["console"].get<bool>();
    }
    if (logging.contains("file")) {
        config.log_file_path = expand_environment_variables(logging["file"].get<std::string>());
        config.enable_file = !config.log_file_path.empty();
    }
}

} // anonymous namespace

CalculatorConfig parse_config_from_string(const std::string& json_string) {
    CalculatorConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Configuration must be a JSON object");
        }

        if (j.contains("defaults")) {
            parse_defaults(require_object(j, "defaults"), config);
        }
        if (j.contains("solver")) {
            parse_solver(require_object(j, "solver"), config.solver);
        }
        if (j.contains("logging")) {
            parse_logging(require_object(j, "logging"), config.logging);
        }
    } catch (const json::exception& e) {
        throw ConfigParseError("Invalid configuration JSON: " + std::string(e.what()));
    }

    return config;
}

CalculatorConfig parse_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    CalculatorConfig config = parse_config_from_string(buffer.str());
    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }
    return config;
}

} // namespace paycalc
