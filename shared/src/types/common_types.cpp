#include "types/common_types.hpp"
#include <charconv>
#include <sstream>
#include <array>

namespace tsimport {
namespace types {

// Point Implementation
Point& Point::add_tag(const std::string& key, const std::string& value) {
    tags[key] = value;
    return *this;
}

Point& Point::add_field(const std::string& key, FieldValue value) {
    fields[key] = std::move(value);
    return *this;
}

Point& Point::set_timestamp(Timestamp ts) {
    timestamp = ts;
    return *this;
}

std::string Point::to_line_protocol() const {
    std::ostringstream line;

    line << line_protocol::escape_measurement(measurement);

    for (const auto& tag : tags) {
        line << "," << line_protocol::escape_key(tag.first)
             << "=" << line_protocol::escape_key(tag.second);
    }

    line << " ";

    bool first_field = true;
    for (const auto& field : fields) {
        if (!first_field) line << ",";
        line << line_protocol::escape_key(field.first) << "="
             << line_protocol::format_field_value(field.second);
        first_field = false;
    }

    line << " " << timestamp;

    return line.str();
}

bool operator==(const Point& lhs, const Point& rhs) {
    return lhs.measurement == rhs.measurement &&
           lhs.tags == rhs.tags &&
           lhs.fields == rhs.fields &&
           lhs.timestamp == rhs.timestamp;
}

std::string format_to_string(ImportFormat format) {
    switch (format) {
        case ImportFormat::LINE_PROTOCOL: return "line_protocol";
        case ImportFormat::CSV: return "csv";
        case ImportFormat::JSON_INFLUX: return "jsoni";
        case ImportFormat::JSON_PROM: return "jsonp";
        default: return "unknown";
    }
}

std::optional<ImportFormat> format_from_string(const std::string& name) {
    if (name.empty() || name == "line_protocol") return ImportFormat::LINE_PROTOCOL;
    if (name == "csv") return ImportFormat::CSV;
    if (name == "jsoni") return ImportFormat::JSON_INFLUX;
    if (name == "jsonp") return ImportFormat::JSON_PROM;
    return std::nullopt;
}

namespace line_protocol {

namespace {

std::string escape_chars(const std::string& value, const char* specials) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        for (const char* s = specials; *s; ++s) {
            if (c == *s) {
                out += '\\';
                break;
            }
        }
        out += c;
    }
    return out;
}

} // anonymous namespace

std::string escape_measurement(const std::string& name) {
    return escape_chars(name, ", \"");
}

std::string escape_key(const std::string& key) {
    return escape_chars(key, ",= \"");
}

std::string escape_string_field(const std::string& value) {
    return "\"" + escape_chars(value, "\"\\") + "\"";
}

std::string format_float(double value) {
    std::array<char, 512> buf{};
    auto result = std::to_chars(buf.data(), buf.data() + buf.size(), value,
                                std::chars_format::fixed);
    if (result.ec != std::errc()) {
        std::ostringstream ss;
        ss << value;
        return ss.str();
    }
    return std::string(buf.data(), result.ptr);
}

std::string format_field_value(const FieldValue& value) {
    switch (field_type_of(value)) {
        case FieldType::STRING:
            return escape_string_field(std::get<std::string>(value));
        case FieldType::FLOAT:
            return format_float(std::get<double>(value));
        case FieldType::INTEGER:
            return std::to_string(std::get<int64_t>(value)) + "i";
        case FieldType::BOOLEAN:
            return std::get<bool>(value) ? "true" : "false";
    }
    return "\"\"";
}

} // namespace line_protocol

} // namespace types
} // namespace tsimport
