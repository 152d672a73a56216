#ifndef PAYCALC_IO_JSON_WRITER_HPP
#define PAYCALC_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include <vector>
#include "../batch.hpp"
#include "../calculator.hpp"

namespace paycalc {
namespace io {

// Write one resolved calculation: request, resolved gross, inversion
// metadata, totals and the ordered breakdown
void write_result_json(std::ostream& os, const CalculationResult& result,
                       bool pretty_print = true);

void write_result_json(const std::string& filepath, const CalculationResult& result,
                       bool pretty_print = true);

// Write a comparison across jurisdictions as {"results": [...]}
void write_comparison_json(std::ostream& os, const std::vector<CalculationResult>& results,
                           bool pretty_print = true);

// Write batch output: {"results": [...], "error_count": N, "execution_time_ms": T}
// Failed rows appear as {"line": L, "error": "..."}
void write_batch_json(std::ostream& os, const BatchResult& batch, bool pretty_print = true);

// Supported jurisdictions (with default payment counts) and profiles
void write_listing_json(std::ostream& os, bool pretty_print = true);

} // namespace io
} // namespace paycalc

#endif // PAYCALC_IO_JSON_WRITER_HPP
