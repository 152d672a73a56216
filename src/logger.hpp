/**
 * @file logger.hpp
 * @brief Structured logging for the calculator with JSON output
 *
 * The Logger provides:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Context tracking (jurisdiction, profile, payments per year)
 *
 * Forward rules never log. Resolution and inversion events are DEBUG;
 * numeric divergence of an inversion is a WARN.
 */

#ifndef PAYCALC_LOGGER_HPP
#define PAYCALC_LOGGER_HPP

#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace paycalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Resolution steps, inversion details
    INFO,    ///< Run start/end, batch summaries
    WARN,    ///< Non-fatal issues (numeric divergence)
    ERROR    ///< Failures
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string (unknown strings map to INFO)
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Calculation context attached to every event
 */
struct CalcContext {
    std::string jurisdiction;
    std::string profile;
    int payments_per_year;

    CalcContext()
        : jurisdiction(""), profile(""), payments_per_year(0) {}

    CalcContext(const std::string& j, const std::string& p, int payments)
        : jurisdiction(j), profile(p), payments_per_year(payments) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("paycalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   CalcContext ctx("Estonia", "Employee", 12);
 *   Logger::get_instance().log_divergence(ctx, "net", 2500.0, 3412.77, 50, 0.03);
 *   @endcode
 *
 * All event methods may be called from several threads at once.
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * Opens (appends to) the log file when file output is enabled.
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log a resolved calculation
     *
     * @param ctx Calculation context
     * @param mode Target mode name ("gross", "net", "total-cost")
     * @param value Caller-supplied value
     * @param gross Resolved gross
     * @param net Net at the resolved gross
     * @param total_cost Total cost at the resolved gross
     */
    void log_calculation(
        const CalcContext& ctx,
        const std::string& mode,
        double value,
        double gross,
        double net,
        double total_cost
    );

    /**
     * @brief Log an inversion (gross recovered from a net or cost target)
     *
     * @param ctx Calculation context
     * @param mode Target mode name
     * @param target Target value
     * @param gross Recovered gross
     * @param method Inversion method name
     * @param iterations Bisection evaluations
     */
    void log_inversion(
        const CalcContext& ctx,
        const std::string& mode,
        double target,
        double gross,
        const std::string& method,
        int iterations
    );

    /**
     * @brief Log a bisection that exhausted its iterations
     *
     * @param ctx Calculation context
     * @param mode Target mode name
     * @param target Target value
     * @param best_gross Best-effort gross returned to the caller
     * @param iterations Evaluations spent
     * @param residual Distance from the target at best_gross
     */
    void log_divergence(
        const CalcContext& ctx,
        const std::string& mode,
        double target,
        double best_gross,
        int iterations,
        double residual
    );

    /**
     * @brief Log error with context
     */
    void log_error(const CalcContext& ctx, const std::string& error_message);

    /**
     * @brief Log warning message
     */
    void log_warning(const CalcContext& ctx, const std::string& warning_message);

    /**
     * @brief Log free-form informational event
     *
     * @param message Message text
     * @param fields Extra fields ("event" is set to "info" unless given)
     */
    void log_info(const std::string& message,
                  const std::map<std::string, std::string>& fields = {});

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

    const LoggerConfig& get_config() const { return config_; }

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    void log(LogLevel level, const std::string& message, std::map<std::string, std::string> fields);
    void add_context(std::map<std::string, std::string>& fields, const CalcContext& ctx) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    void write_output(const std::string& output);
};

/**
 * @brief Escape a string for inclusion in a JSON string literal
 */
std::string escape_json_string(const std::string& str);

/**
 * @brief Format a double with fixed precision (no locale grouping)
 */
std::string format_amount(double value, int precision = 2);

} // namespace paycalc

#endif // PAYCALC_LOGGER_HPP
