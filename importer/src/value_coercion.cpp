#include "value_coercion.hpp"
#include <charconv>
#include <chrono>
#include <cctype>
#include <cmath>
#include <limits>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace tsimport {
namespace importer {

namespace {

constexpr int64_t NANOS_PER_SECOND = 1000000000LL;

bool parse_int64(const std::string& text, int64_t& out) {
    if (text.empty()) return false;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (*first == '+') ++first;
    auto result = std::from_chars(first, last, out);
    return result.ec == std::errc() && result.ptr == last;
}

bool parse_double(const std::string& text, double& out) {
    if (text.empty()) return false;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (*first == '+') ++first;
    auto result = std::from_chars(first, last, out);
    return result.ec == std::errc() && result.ptr == last;
}

bool is_true_literal(const std::string& token) {
    return token == "t" || token == "T" || token == "true" || token == "True" || token == "TRUE";
}

bool is_false_literal(const std::string& token) {
    return token == "f" || token == "F" || token == "false" || token == "False" || token == "FALSE";
}

} // namespace

std::string field_to_string(const types::OptionalValue& value) {
    if (!value) {
        return "\"\"";
    }
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return types::line_protocol::escape_string_field(v);
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else {
            return types::line_protocol::format_float(v);
        }
    }, *value);
}

std::string timestamp_to_string(const types::OptionalValue& value, int64_t time_multiplier) {
    if (!value) {
        return "";
    }
    if (const auto* i = std::get_if<int64_t>(&*value)) {
        return std::to_string(*i);
    }
    if (const auto* d = std::get_if<double>(&*value)) {
        return types::line_protocol::format_float(*d);
    }
    if (const auto* s = std::get_if<std::string>(&*value)) {
        auto nanos = parse_rfc3339_nanos(*s);
        if (!nanos) {
            return "";
        }
        return std::to_string(*nanos / (time_multiplier > 0 ? time_multiplier : 1));
    }
    return "";
}

std::string parse_to_string(const types::OptionalValue& value, CoercionKind kind, int64_t time_multiplier) {
    switch (kind) {
        case CoercionKind::FIELD: return field_to_string(value);
        case CoercionKind::TIMESTAMP: return timestamp_to_string(value, time_multiplier);
    }
    return "";
}

std::optional<int64_t> parse_rfc3339_nanos(const std::string& text) {
    // YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)
    if (text.size() < 20) {
        return std::nullopt;
    }

    std::tm tm = {};
    std::istringstream head(text.substr(0, 19));
    head >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (head.fail() || (text[10] != 'T' && text[10] != 't')) {
        return std::nullopt;
    }

    size_t pos = 19;
    int64_t fraction = 0;
    if (text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 9) {
                fraction = fraction * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 9; ++i) {
            fraction *= 10;
        }
    }

    if (pos >= text.size()) {
        return std::nullopt;
    }

    int64_t offset_seconds = 0;
    char zone = text[pos];
    if (zone == 'Z' || zone == 'z') {
        ++pos;
    } else if (zone == '+' || zone == '-') {
        if (text.size() - pos != 6 || text[pos + 3] != ':') {
            return std::nullopt;
        }
        int64_t hours = 0;
        int64_t minutes = 0;
        if (!parse_int64(text.substr(pos + 1, 2), hours) || !parse_int64(text.substr(pos + 4, 2), minutes)) {
            return std::nullopt;
        }
        offset_seconds = (hours * 60 + minutes) * 60;
        if (zone == '-') {
            offset_seconds = -offset_seconds;
        }
        pos += 6;
    } else {
        return std::nullopt;
    }

    if (pos != text.size()) {
        return std::nullopt;
    }

    int64_t seconds = static_cast<int64_t>(timegm(&tm)) - offset_seconds;
    auto nanos = scale_timestamp(seconds, NANOS_PER_SECOND);
    if (!nanos) {
        return std::nullopt;
    }
    return *nanos + fraction;
}

std::optional<int64_t> scale_timestamp(int64_t value, int64_t multiplier) {
    if (multiplier <= 1) {
        return value;
    }
    if (value > std::numeric_limits<int64_t>::max() / multiplier ||
        value < std::numeric_limits<int64_t>::min() / multiplier) {
        return std::nullopt;
    }
    return value * multiplier;
}

std::optional<int64_t> truncate_to_int64(double value) {
    // 2^63, exactly representable
    constexpr double LIMIT = 9223372036854775808.0;
    if (!std::isfinite(value) || value < -LIMIT || value >= LIMIT) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

int64_t parse_timestamp_best_effort(const std::string& text, int64_t time_multiplier) {
    int64_t integer = 0;
    if (parse_int64(text, integer)) {
        if (auto scaled = scale_timestamp(integer, time_multiplier)) {
            return *scaled;
        }
    }
    double decimal = 0;
    if (parse_double(text, decimal)) {
        if (auto truncated = truncate_to_int64(decimal)) {
            if (auto scaled = scale_timestamp(*truncated, time_multiplier)) {
                return *scaled;
            }
        }
    }
    if (auto nanos = parse_rfc3339_nanos(text)) {
        return *nanos;
    }
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

types::FieldValue infer_field_value(const std::string& token, bool quoted) {
    if (quoted) {
        return token;
    }
    if (token.size() > 1 && (token.back() == 'i' || token.back() == 'u')) {
        int64_t integer = 0;
        if (parse_int64(token.substr(0, token.size() - 1), integer)) {
            if (token.back() == 'i' || integer >= 0) {
                return integer;
            }
        }
    }
    if (is_true_literal(token)) {
        return true;
    }
    if (is_false_literal(token)) {
        return false;
    }
    double decimal = 0;
    if (parse_double(token, decimal)) {
        return decimal;
    }
    return token;
}

} // namespace importer
} // namespace tsimport
