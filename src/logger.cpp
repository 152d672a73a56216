/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace paycalc {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log_calculation(
    const CalcContext& ctx,
    const std::string& mode,
    double value,
    double gross,
    double net,
    double total_cost
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "calculation";
    add_context(fields, ctx);
    fields["mode"] = mode;
    fields["value"] = format_amount(value);
    fields["gross"] = format_amount(gross);
    fields["net"] = format_amount(net);
    fields["total_cost"] = format_amount(total_cost);

    log(LogLevel::DEBUG, "Calculation resolved", std::move(fields));
}

void Logger::log_inversion(
    const CalcContext& ctx,
    const std::string& mode,
    double target,
    double gross,
    const std::string& method,
    int iterations
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "inversion";
    add_context(fields, ctx);
    fields["mode"] = mode;
    fields["target"] = format_amount(target);
    fields["gross"] = format_amount(gross, 6);
    fields["method"] = method;
    fields["iterations"] = std::to_string(iterations);

    log(LogLevel::DEBUG, "Gross recovered from target", std::move(fields));
}

void Logger::log_divergence(
    const CalcContext& ctx,
    const std::string& mode,
    double target,
    double best_gross,
    int iterations,
    double residual
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "numeric_divergence";
    add_context(fields, ctx);
    fields["mode"] = mode;
    fields["target"] = format_amount(target);
    fields["best_gross"] = format_amount(best_gross, 6);
    fields["iterations"] = std::to_string(iterations);
    fields["residual"] = format_amount(residual, 6);

    log(LogLevel::WARN, "Bisection did not reach tolerance; returning best approximation",
        std::move(fields));
}

void Logger::log_error(const CalcContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    add_context(fields, ctx);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Calculation error", std::move(fields));
}

void Logger::log_warning(const CalcContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    add_context(fields, ctx);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, std::move(fields));
}

void Logger::log_info(const std::string& message,
                      const std::map<std::string, std::string>& fields) {
    std::map<std::string, std::string> all_fields = fields;
    if (all_fields.find("event") == all_fields.end()) {
        all_fields["event"] = "info";
    }
    log(LogLevel::INFO, message, std::move(all_fields));
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::add_context(std::map<std::string, std::string>& fields, const CalcContext& ctx) const {
    if (!ctx.jurisdiction.empty()) {
        fields["jurisdiction"] = ctx.jurisdiction;
    }
    if (!ctx.profile.empty()) {
        fields["profile"] = ctx.profile;
    }
    if (ctx.payments_per_year > 0) {
        fields["payments_per_year"] = std::to_string(ctx.payments_per_year);
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    std::map<std::string, std::string> fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        fields["timestamp"] = get_timestamp();
        fields["level"] = level_to_string(level);
        fields["message"] = message;
        output = format_json(fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

// Called with mutex_ held
void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

std::string escape_json_string(const std::string& str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                        << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

std::string format_amount(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

} // namespace paycalc
