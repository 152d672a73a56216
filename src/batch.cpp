#include "batch.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <initializer_list>
#include <map>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace paycalc {

BatchResult::BatchResult() : execution_time_ms(0.0) {}

size_t BatchResult::error_count() const {
    return static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
                                             [](const BatchEntry& e) { return !e.ok; }));
}

namespace {

double parse_number(const std::string& column, const std::string& text) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw InvalidInputError("Column '" + column + "': not a number: '" + text + "'");
    }
    if (consumed != text.size()) {
        throw InvalidInputError("Column '" + column + "': not a number: '" + text + "'");
    }
    return value;
}

int parse_count(const std::string& column, const std::string& text) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw InvalidInputError("Column '" + column + "': not an integer: '" + text + "'");
    }
    if (consumed != text.size()) {
        throw InvalidInputError("Column '" + column + "': not an integer: '" + text + "'");
    }
    return value;
}

} // anonymous namespace

std::vector<BatchRow> load_batch_csv(std::istream& is) {
    CsvReader reader(is);

    std::vector<std::string> header;
    while (header.empty() && reader.has_more()) {
        header = reader.read_row();
    }
    if (header.empty()) {
        throw InvalidInputError("Batch input is empty");
    }

    std::map<std::string, size_t> columns;
    for (size_t i = 0; i < header.size(); ++i) {
        columns[header[i]] = i;
    }
    for (const char* required : {"country", "profile", "mode", "value"}) {
        if (columns.find(required) == columns.end()) {
            throw InvalidInputError(std::string("Batch header missing required column: ") + required);
        }
    }

    std::vector<BatchRow> rows;
    while (reader.has_more()) {
        std::vector<std::string> cells = reader.read_row();
        if (cells.empty()) {
            continue;
        }

        BatchRow row;
        row.line = reader.line_number();

        auto cell = [&cells, &columns](const std::string& name) -> std::string {
            auto it = columns.find(name);
            if (it == columns.end() || it->second >= cells.size()) {
                return "";
            }
            return cells[it->second];
        };

        try {
            row.request.jurisdiction = parse_jurisdiction(cell("country"));
            row.request.profile = parse_profile(cell("profile"));
            row.request.mode = parse_target_mode(cell("mode"));
            row.request.value = parse_number("value", cell("value"));
            std::string expenses = cell("expenses");
            row.request.expenses = expenses.empty() ? 0.0 : parse_number("expenses", expenses);
            std::string payments = cell("payments");
            row.request.payments_per_year = payments.empty() ? 0 : parse_count("payments", payments);
        } catch (const PayCalcError& e) {
            row.parse_error = e.what();
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<BatchRow> load_batch_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw InvalidInputError("Failed to open batch file: " + filepath);
    }
    return load_batch_csv(file);
}

BatchResult run_batch(const std::vector<BatchRow>& rows, const Calculator& calculator) {
    auto start_time = std::chrono::high_resolution_clock::now();

    BatchResult batch;
    batch.entries.resize(rows.size());

    // Each row writes only its own slot
#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 16)
#endif
    for (size_t i = 0; i < rows.size(); ++i) {
        const BatchRow& row = rows[i];
        BatchEntry& entry = batch.entries[i];
        entry.line = row.line;
        entry.ok = false;

        if (!row.parse_error.empty()) {
            entry.error = row.parse_error;
            continue;
        }
        try {
            entry.result = calculator.resolve(row.request);
            entry.ok = true;
        } catch (const std::exception& e) {
            // Nothing may escape the parallel region
            entry.error = e.what();
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    batch.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    std::map<std::string, std::string> fields;
    fields["event"] = "batch_complete";
    fields["rows"] = std::to_string(rows.size());
    fields["errors"] = std::to_string(batch.error_count());
    fields["execution_time_ms"] = format_amount(batch.execution_time_ms);
    Logger::get_instance().log_info("Batch completed", fields);

    return batch;
}

} // namespace paycalc
