#pragma once

#include <string>
#include <map>
#include <vector>
#include <variant>
#include <optional>
#include <cstdint>

namespace tsimport {
namespace types {

// Basic types
using Timestamp = int64_t;              // nanoseconds since epoch unless stated otherwise
using Database = std::string;
using RetentionPolicy = std::string;
using Measurement = std::string;

// Typed scalar carried by a field. Alternatives are ordered so that
// index() doubles as the column type tag on the wire.
using FieldValue = std::variant<std::string, double, int64_t, bool>;

// A decoded value that may be absent (JSON null, missing cell, unsupported type)
using OptionalValue = std::optional<FieldValue>;

enum class FieldType {
    STRING = 0,
    FLOAT = 1,
    INTEGER = 2,
    BOOLEAN = 3
};

inline FieldType field_type_of(const FieldValue& value) {
    return static_cast<FieldType>(value.index());
}

// Canonical time-series record
struct Point {
    Measurement measurement;
    std::map<std::string, std::string> tags;
    std::map<std::string, FieldValue> fields;
    Timestamp timestamp = 0;

    Point() = default;
    explicit Point(const std::string& measurement_name) : measurement(measurement_name) {}

    Point& add_tag(const std::string& key, const std::string& value);
    Point& add_field(const std::string& key, FieldValue value);
    Point& set_timestamp(Timestamp ts);

    bool has_fields() const { return !fields.empty(); }

    // Render back to protocol text, escaping structural characters
    std::string to_line_protocol() const;
};

bool operator==(const Point& lhs, const Point& rhs);

// Logical column name -> position in a structured header
struct FieldPos {
    std::string name;
    int pos = -1;

    FieldPos() = default;
    FieldPos(std::string n, int p) : name(std::move(n)), pos(p) {}

    bool resolved() const { return !name.empty() && pos >= 0; }
};

// Supported input formats
enum class ImportFormat {
    LINE_PROTOCOL,
    CSV,
    JSON_INFLUX,
    JSON_PROM
};

std::string format_to_string(ImportFormat format);
std::optional<ImportFormat> format_from_string(const std::string& name);

// Line protocol escaping helpers
namespace line_protocol {
    std::string escape_measurement(const std::string& name);
    std::string escape_key(const std::string& key);          // tag keys, tag values, field keys
    std::string escape_string_field(const std::string& value);
    std::string format_field_value(const FieldValue& value);
    std::string format_float(double value);                  // shortest round-trip, no exponent
}

} // namespace types
} // namespace tsimport
