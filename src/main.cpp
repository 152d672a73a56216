#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "batch.hpp"
#include "calculator.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "io/json_writer.hpp"

namespace {

constexpr const char* VERSION = "1.0.0";

struct CLIArgs {
    std::string country;
    std::string profile;
    std::string config_path;
    std::string batch_path;
    std::string output_path;
    std::string log_level;
    int target_count = 0;               // Number of --gross/--net/--total-cost given
    paycalc::TargetMode mode = paycalc::TargetMode::Gross;
    double value = 0.0;
    double expenses = 0.0;
    int payments = 0;                   // 0 = not given
    bool compare = false;
    bool list = false;
    bool compact = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "PayCalc v" << VERSION << "\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Target (exactly one):\n";
    std::cerr << "  --gross <amount>            Gross monthly salary\n";
    std::cerr << "  --net <amount>              Desired net monthly salary (solves for gross)\n";
    std::cerr << "  --total-cost <amount>       Desired monthly employer cost (solves for gross)\n\n";
    std::cerr << "Rule selection:\n";
    std::cerr << "  --country <name>            Bulgaria, Estonia or Greece (default: Bulgaria)\n";
    std::cerr << "  --profile <name>            Employee, Self-Employed or Small Business\n";
    std::cerr << "                              (default: Employee)\n";
    std::cerr << "  --expenses <amount>         Deductible expenses for flat-rate profiles (default: 0)\n";
    std::cerr << "  --payments <count>          Salary payments per year (default: 14 for Greece,\n";
    std::cerr << "                              12 elsewhere)\n";
    std::cerr << "  --compare                   Resolve the target in every country\n\n";
    std::cerr << "Batch options:\n";
    std::cerr << "  --batch <path>              CSV with columns country,profile,mode,value\n";
    std::cerr << "                              [,expenses][,payments]\n\n";
    std::cerr << "Configuration and output:\n";
    std::cerr << "  --config <path>             JSON configuration file\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --compact                   Single-line JSON output\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR\n";
    std::cerr << "  --list                      List supported countries and profiles\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  " << program_name << " --country Greece --net 1500 --payments 14\n";
    std::cerr << "  " << program_name << " --compare --total-cost 2500\n";
    std::cerr << "  " << program_name << " --batch salaries.csv --output results.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

// Whole-argument conversions: "1000abc" is rejected, not read as 1000
double parse_amount(const std::string& text) {
    size_t consumed = 0;
    double value = std::stod(text, &consumed);
    if (consumed != text.size()) {
        throw std::invalid_argument(text);
    }
    return value;
}

int parse_count(const std::string& text) {
    size_t consumed = 0;
    int value = std::stoi(text, &consumed);
    if (consumed != text.size()) {
        throw std::invalid_argument(text);
    }
    return value;
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--country" && i + 1 < argc) {
                args.country = argv[++i];
            } else if (arg == "--profile" && i + 1 < argc) {
                args.profile = argv[++i];
            } else if (arg == "--gross" && i + 1 < argc) {
                args.mode = paycalc::TargetMode::Gross;
                args.value = parse_amount(argv[++i]);
                args.target_count++;
            } else if (arg == "--net" && i + 1 < argc) {
                args.mode = paycalc::TargetMode::Net;
                args.value = parse_amount(argv[++i]);
                args.target_count++;
            } else if (arg == "--total-cost" && i + 1 < argc) {
                args.mode = paycalc::TargetMode::TotalCost;
                args.value = parse_amount(argv[++i]);
                args.target_count++;
            } else if (arg == "--expenses" && i + 1 < argc) {
                args.expenses = parse_amount(argv[++i]);
            } else if (arg == "--payments" && i + 1 < argc) {
                args.payments = parse_count(argv[++i]);
                if (args.payments < 1) {
                    std::cerr << "Error: --payments must be at least 1\n\n";
                    return false;
                }
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--batch" && i + 1 < argc) {
                args.batch_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            } else if (arg == "--compare") {
                args.compare = true;
            } else if (arg == "--list") {
                args.list = true;
            } else if (arg == "--compact") {
                args.compact = true;
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid number for " << arg << ": " << argv[i] << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (!args.config_path.empty() && !file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (!args.batch_path.empty() && !file_exists(args.batch_path)) {
        std::cerr << "Error: Batch file not found: " << args.batch_path << "\n";
        valid = false;
    }

    if (!args.log_level.empty() && args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    if (args.list) {
        return valid;
    }

    if (!args.batch_path.empty()) {
        if (args.target_count > 0 || args.compare) {
            std::cerr << "Error: --batch cannot be combined with a target or --compare\n";
            valid = false;
        }
        return valid;
    }

    if (args.target_count == 0) {
        std::cerr << "Error: one of --gross, --net or --total-cost is required\n";
        valid = false;
    } else if (args.target_count > 1) {
        std::cerr << "Error: only one of --gross, --net or --total-cost may be given\n";
        valid = false;
    }

    if (args.value < 0) {
        std::cerr << "Error: target amount must be non-negative\n";
        valid = false;
    }

    if (args.expenses < 0) {
        std::cerr << "Error: --expenses must be non-negative\n";
        valid = false;
    }

    if (args.compare && !args.country.empty()) {
        std::cerr << "Warning: --country is ignored with --compare\n";
    }

    return valid;
}

// Writes to --output when given, stdout otherwise
template <typename WriteFn>
void emit(const CLIArgs& args, WriteFn write) {
    if (args.output_path.empty()) {
        write(std::cout);
        return;
    }
    std::ofstream file(args.output_path);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + args.output_path);
    }
    write(file);
    std::cerr << "Output written to: " << args.output_path << "\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    try {
        paycalc::CalculatorConfig config;
        if (!args.config_path.empty()) {
            config = paycalc::parse_config_from_file(args.config_path);
        }

        // Command-line flags win over the config file
        if (!args.log_level.empty()) {
            config.logging.min_level = paycalc::string_to_level(args.log_level);
        }
        paycalc::Logger::get_instance().configure(config.logging);

        const bool pretty = !args.compact;

        if (args.list) {
            emit(args, [pretty](std::ostream& os) { paycalc::io::write_listing_json(os, pretty); });
            return 0;
        }

        paycalc::Calculator calculator(config.solver);

        if (!args.batch_path.empty()) {
            std::vector<paycalc::BatchRow> rows = paycalc::load_batch_csv(args.batch_path);
            paycalc::BatchResult batch = paycalc::run_batch(rows, calculator);
            emit(args, [&batch, pretty](std::ostream& os) {
                paycalc::io::write_batch_json(os, batch, pretty);
            });
            std::cerr << "Processed " << batch.entries.size() << " rows ("
                      << batch.error_count() << " errors) in "
                      << paycalc::format_amount(batch.execution_time_ms) << " ms\n";
            return batch.error_count() == 0 ? 0 : 2;
        }

        paycalc::EmploymentProfile profile =
            args.profile.empty() ? config.profile : paycalc::parse_profile(args.profile);
        int payments = args.payments > 0 ? args.payments : config.payments_per_year;

        if (args.compare) {
            std::vector<paycalc::CalculationResult> results =
                calculator.compare(profile, args.mode, args.value, args.expenses, payments);
            emit(args, [&results, pretty](std::ostream& os) {
                paycalc::io::write_comparison_json(os, results, pretty);
            });
            return 0;
        }

        paycalc::Jurisdiction jurisdiction =
            args.country.empty() ? config.jurisdiction : paycalc::parse_jurisdiction(args.country);

        paycalc::CalculationResult result = calculator.resolve(paycalc::CalculationRequest(
            jurisdiction, profile, args.mode, args.value, args.expenses, payments));

        if (!result.inversion.converged) {
            std::cerr << "Warning: gross is approximate (bisection stopped after "
                      << result.inversion.iterations << " iterations)\n";
        }

        emit(args, [&result, pretty](std::ostream& os) {
            paycalc::io::write_result_json(os, result, pretty);
        });
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
