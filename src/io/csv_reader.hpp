#ifndef PAYCALC_CSV_READER_HPP
#define PAYCALC_CSV_READER_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace paycalc {

class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    // Next row with cells trimmed; empty vector at end of input or on a blank line
    std::vector<std::string> read_row();
    bool has_more() const;

    // 1-based number of the line last returned by read_row()
    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    static std::string trim(const std::string& s);
};

} // namespace paycalc

#endif // PAYCALC_CSV_READER_HPP
