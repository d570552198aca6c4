#include "csv_reader.hpp"
#include "core/exceptions.hpp"

namespace tsimport {
namespace importer {

CsvReader::CsvReader(std::istream& input, char delimiter, char comment)
    : input_(input), delimiter_(delimiter), comment_(comment) {}

bool CsvReader::next_line(std::string& line) {
    if (!std::getline(input_, line)) {
        return false;
    }
    ++line_number_;
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

bool CsvReader::read_row(std::vector<std::string>& row) {
    std::string line;
    do {
        if (!next_line(line)) {
            return false;
        }
    } while (line.empty() || line[0] == comment_);

    enum class Mode { FIELD_START, UNQUOTED, QUOTED, QUOTE_IN_QUOTED };

    row.clear();
    size_t start_line = line_number_;
    std::string field;
    std::string error;
    Mode mode = Mode::FIELD_START;

    while (true) {
        for (char c : line) {
            switch (mode) {
                case Mode::FIELD_START:
                    if (c == '"') {
                        mode = Mode::QUOTED;
                    } else if (c == delimiter_) {
                        row.push_back(std::move(field));
                        field.clear();
                    } else {
                        field.push_back(c);
                        mode = Mode::UNQUOTED;
                    }
                    break;
                case Mode::UNQUOTED:
                    if (c == delimiter_) {
                        row.push_back(std::move(field));
                        field.clear();
                        mode = Mode::FIELD_START;
                    } else {
                        if (c == '"' && error.empty()) {
                            error = "bare \" in non-quoted field";
                        }
                        field.push_back(c);
                    }
                    break;
                case Mode::QUOTED:
                    if (c == '"') {
                        mode = Mode::QUOTE_IN_QUOTED;
                    } else {
                        field.push_back(c);
                    }
                    break;
                case Mode::QUOTE_IN_QUOTED:
                    if (c == '"') {
                        field.push_back('"');
                        mode = Mode::QUOTED;
                    } else if (c == delimiter_) {
                        row.push_back(std::move(field));
                        field.clear();
                        mode = Mode::FIELD_START;
                    } else {
                        if (error.empty()) {
                            error = "extraneous or missing \" in quoted-field";
                        }
                        field.push_back(c);
                        mode = Mode::UNQUOTED;
                    }
                    break;
            }
        }

        if (mode != Mode::QUOTED) {
            break;
        }
        // Quoted field continues on the next physical line
        if (!next_line(line)) {
            throw ParseError("record on line " + std::to_string(start_line) +
                             ": extraneous or missing \" in quoted-field");
        }
        field.push_back('\n');
    }
    row.push_back(std::move(field));

    if (!error.empty()) {
        throw ParseError("record on line " + std::to_string(start_line) + ": " + error);
    }

    if (expected_fields_ == 0) {
        expected_fields_ = row.size();
    } else if (row.size() != expected_fields_) {
        throw ParseError("record on line " + std::to_string(start_line) + ": wrong number of fields, expected " +
                         std::to_string(expected_fields_) + " got " + std::to_string(row.size()));
    }
    return true;
}

} // namespace importer
} // namespace tsimport
