#ifndef PAYCALC_BATCH_HPP
#define PAYCALC_BATCH_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <vector>
#include "calculator.hpp"

namespace paycalc {

// One data line of a batch file. Rows that fail to parse keep their error
// and are reported, not dropped.
struct BatchRow {
    size_t line;                 // 1-based line in the input file
    CalculationRequest request;
    std::string parse_error;     // Empty when request is usable
};

struct BatchEntry {
    size_t line;
    bool ok;
    CalculationResult result;    // Valid only when ok
    std::string error;
};

struct BatchResult {
    std::vector<BatchEntry> entries;
    double execution_time_ms;

    BatchResult();

    size_t error_count() const;
};

// Reads CSV with header: country,profile,mode,value[,expenses][,payments]
// (any column order). Blank lines are skipped.
// Throws InvalidInputError when the header lacks a required column.
std::vector<BatchRow> load_batch_csv(std::istream& is);
std::vector<BatchRow> load_batch_csv(const std::string& filepath);

// Resolves every row independently; rows run in parallel under OpenMP
BatchResult run_batch(const std::vector<BatchRow>& rows, const Calculator& calculator);

} // namespace paycalc

#endif // PAYCALC_BATCH_HPP
