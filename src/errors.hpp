#ifndef PAYCALC_ERRORS_HPP
#define PAYCALC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace paycalc {

enum class ErrorKind {
    InvalidInput,
    UnsupportedCombination,
    InvalidConfig
};

inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput: return "InvalidInput";
        case ErrorKind::UnsupportedCombination: return "UnsupportedCombination";
        case ErrorKind::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

// Base class for every error raised by the calculator
class PayCalcError : public std::runtime_error {
public:
    PayCalcError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Negative or non-finite amounts, non-positive payment counts, malformed rows
class InvalidInputError : public PayCalcError {
public:
    explicit InvalidInputError(const std::string& message)
        : PayCalcError(ErrorKind::InvalidInput, message) {}
};

// (jurisdiction, profile) pair with no registered rule
class UnsupportedCombinationError : public PayCalcError {
public:
    explicit UnsupportedCombinationError(const std::string& message)
        : PayCalcError(ErrorKind::UnsupportedCombination, message) {}
};

// Configuration file cannot be read, parsed or validated
class ConfigParseError : public PayCalcError {
public:
    explicit ConfigParseError(const std::string& message)
        : PayCalcError(ErrorKind::InvalidConfig, message) {}
};

} // namespace paycalc

#endif // PAYCALC_ERRORS_HPP
