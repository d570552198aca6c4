#pragma once

#include <istream>
#include <string>
#include <vector>
#include <cstddef>

namespace tsimport {
namespace importer {

// RFC 4180 record reader. Quoted fields may span lines and use "" for a
// literal quote; blank lines and lines starting with the comment
// character are skipped. Every record must have the width of the first.
class CsvReader {
public:
    explicit CsvReader(std::istream& input, char delimiter = ',', char comment = '#');

    // False at end of input. A malformed record throws ParseError after it
    // has been consumed, so reading can continue with the next one.
    bool read_row(std::vector<std::string>& row);

    size_t line_number() const { return line_number_; }

private:
    bool next_line(std::string& line);

    std::istream& input_;
    char delimiter_;
    char comment_;
    size_t line_number_ = 0;
    size_t expected_fields_ = 0;
};

} // namespace importer
} // namespace tsimport
