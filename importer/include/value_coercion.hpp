#pragma once

#include "types/common_types.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace tsimport {
namespace importer {

enum class CoercionKind {
    FIELD,
    TIMESTAMP
};

// Protocol text for a decoded field value: numbers in shortest decimal
// form, booleans as true/false, strings quoted and escaped, absent or
// unsupported values as an empty quoted string.
std::string field_to_string(const types::OptionalValue& value);

// Protocol text for a decoded timestamp. Numbers pass through, RFC3339
// strings become integer time in the configured precision, anything else
// yields an empty string.
std::string timestamp_to_string(const types::OptionalValue& value, int64_t time_multiplier);

std::string parse_to_string(const types::OptionalValue& value, CoercionKind kind, int64_t time_multiplier);

// Nanoseconds since epoch for an RFC3339 string, std::nullopt when malformed
std::optional<int64_t> parse_rfc3339_nanos(const std::string& text);

// value * multiplier, std::nullopt when the product leaves the int64 range
std::optional<int64_t> scale_timestamp(int64_t value, int64_t multiplier);

// Truncated integer part of a finite double inside the int64 range
std::optional<int64_t> truncate_to_int64(double value);

// Timestamp column of a CSV row: integer or decimal text in the configured
// precision, or RFC3339. Empty, unparseable or out-of-range text yields the
// current time.
int64_t parse_timestamp_best_effort(const std::string& text, int64_t time_multiplier);

// Typed value of an unquoted protocol token: Ni/Nu integers, boolean
// literals, decimals, anything else a string. Quoted tokens stay strings.
types::FieldValue infer_field_value(const std::string& token, bool quoted);

} // namespace importer
} // namespace tsimport
