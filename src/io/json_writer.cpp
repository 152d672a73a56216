#include "json_writer.hpp"
#include "../logger.hpp"
#include <fstream>
#include <stdexcept>

namespace paycalc {
namespace io {

namespace {

// Whitespace for one pretty-printing mode
struct Layout {
    bool pretty;

    std::string indent(int depth) const { return pretty ? std::string(static_cast<size_t>(depth) * 2, ' ') : ""; }
    std::string newline() const { return pretty ? "\n" : ""; }
    std::string space() const { return pretty ? " " : ""; }
};

std::string quoted(const std::string& s) {
    return "\"" + escape_json_string(s) + "\"";
}

void write_result_object(std::ostream& os, const CalculationResult& result,
                         const Layout& l, int depth) {
    const std::string in = l.indent(depth + 1);
    const std::string nl = l.newline();
    const std::string sp = l.space();
    const CalculationRequest& req = result.request;
    const TaxBreakdown& b = result.breakdown;

    os << "{" << nl;
    os << in << "\"country\":" << sp << quoted(to_string(req.jurisdiction)) << "," << nl;
    os << in << "\"profile\":" << sp << quoted(to_string(req.profile)) << "," << nl;
    os << in << "\"mode\":" << sp << quoted(to_string(req.mode)) << "," << nl;
    os << in << "\"value\":" << sp << format_amount(req.value) << "," << nl;
    os << in << "\"expenses\":" << sp << format_amount(req.expenses) << "," << nl;
    os << in << "\"payments_per_year\":" << sp << result.payments_per_year << "," << nl;
    os << in << "\"gross\":" << sp << format_amount(result.gross) << "," << nl;

    os << in << "\"inversion\":" << sp << "{" << nl;
    os << l.indent(depth + 2) << "\"method\":" << sp << quoted(to_string(result.inversion.method))
       << "," << nl;
    os << l.indent(depth + 2) << "\"iterations\":" << sp << result.inversion.iterations << "," << nl;
    os << l.indent(depth + 2) << "\"converged\":" << sp
       << (result.inversion.converged ? "true" : "false") << nl;
    os << in << "}," << nl;

    os << in << "\"total_tax\":" << sp << format_amount(b.total_tax) << "," << nl;
    os << in << "\"net\":" << sp << format_amount(b.net) << "," << nl;
    os << in << "\"total_cost\":" << sp << format_amount(b.total_cost) << "," << nl;

    os << in << "\"breakdown\":" << sp << "[";
    for (size_t i = 0; i < b.breakdown.size(); ++i) {
        os << (i > 0 ? "," : "") << nl << l.indent(depth + 2) << "{\"name\":" << sp
           << quoted(b.breakdown[i].first) << "," << sp << "\"value\":" << sp
           << format_amount(b.breakdown[i].second) << "}";
    }
    if (!b.breakdown.empty()) {
        os << nl << in;
    }
    os << "]" << nl;

    os << l.indent(depth) << "}";
}

} // anonymous namespace

void write_result_json(std::ostream& os, const CalculationResult& result, bool pretty_print) {
    Layout layout{pretty_print};
    write_result_object(os, result, layout, 0);
    os << layout.newline();
}

void write_result_json(const std::string& filepath, const CalculationResult& result,
                       bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_result_json(file, result, pretty_print);
}

void write_comparison_json(std::ostream& os, const std::vector<CalculationResult>& results,
                           bool pretty_print) {
    Layout l{pretty_print};
    os << "{" << l.newline();
    os << l.indent(1) << "\"results\":" << l.space() << "[";
    for (size_t i = 0; i < results.size(); ++i) {
        os << (i > 0 ? "," : "") << l.newline() << l.indent(2);
        write_result_object(os, results[i], l, 2);
    }
    if (!results.empty()) {
        os << l.newline() << l.indent(1);
    }
    os << "]" << l.newline();
    os << "}" << l.newline();
}

void write_batch_json(std::ostream& os, const BatchResult& batch, bool pretty_print) {
    Layout l{pretty_print};
    os << "{" << l.newline();
    os << l.indent(1) << "\"results\":" << l.space() << "[";
    for (size_t i = 0; i < batch.entries.size(); ++i) {
        const BatchEntry& entry = batch.entries[i];
        os << (i > 0 ? "," : "") << l.newline() << l.indent(2);
        if (entry.ok) {
            write_result_object(os, entry.result, l, 2);
        } else {
            os << "{\"line\":" << l.space() << entry.line << "," << l.space()
               << "\"error\":" << l.space() << quoted(entry.error) << "}";
        }
    }
    if (!batch.entries.empty()) {
        os << l.newline() << l.indent(1);
    }
    os << "]," << l.newline();
    os << l.indent(1) << "\"error_count\":" << l.space() << batch.error_count() << "," << l.newline();
    os << l.indent(1) << "\"execution_time_ms\":" << l.space()
       << format_amount(batch.execution_time_ms) << l.newline();
    os << "}" << l.newline();
}

void write_listing_json(std::ostream& os, bool pretty_print) {
    Layout l{pretty_print};
    const std::vector<Jurisdiction> jurisdictions = list_jurisdictions();
    const std::vector<EmploymentProfile> profiles = list_profiles();

    os << "{" << l.newline();
    os << l.indent(1) << "\"jurisdictions\":" << l.space() << "[";
    for (size_t i = 0; i < jurisdictions.size(); ++i) {
        os << (i > 0 ? "," : "") << l.newline() << l.indent(2) << "{\"name\":" << l.space()
           << quoted(to_string(jurisdictions[i])) << "," << l.space()
           << "\"default_payments_per_year\":" << l.space()
           << default_payments_per_year(jurisdictions[i]) << "}";
    }
    os << l.newline() << l.indent(1) << "]," << l.newline();
    os << l.indent(1) << "\"profiles\":" << l.space() << "[";
    for (size_t i = 0; i < profiles.size(); ++i) {
        os << (i > 0 ? "," : "") << l.newline() << l.indent(2) << quoted(to_string(profiles[i]));
    }
    os << l.newline() << l.indent(1) << "]" << l.newline();
    os << "}" << l.newline();
}

} // namespace io
} // namespace paycalc
