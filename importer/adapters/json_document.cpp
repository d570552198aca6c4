#include "json_document.hpp"
#include "core/exceptions.hpp"
#include <limits>

namespace tsimport {
namespace importer {

namespace {

void collect_arrays(const JsonValue& node, const std::string& key, std::vector<const JsonValue*>& out) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (it.key() == key && it.value().is_array()) {
                out.push_back(&it.value());
            } else {
                collect_arrays(it.value(), key, out);
            }
        }
    } else if (node.is_array()) {
        for (const auto& element : node) {
            collect_arrays(element, key, out);
        }
    }
}

} // namespace

JsonValue JsonDocument::parse(std::istream& input) {
    try {
        return JsonValue::parse(input);
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(std::string("invalid json document: ") + e.what());
    }
}

std::vector<const JsonValue*> JsonDocument::find_arrays(const JsonValue& document, const std::string& key) {
    std::vector<const JsonValue*> arrays;
    collect_arrays(document, key, arrays);
    return arrays;
}

types::OptionalValue to_optional_value(const JsonValue& value) {
    switch (value.type()) {
        case JsonValue::value_t::string:
            return types::FieldValue(value.get<std::string>());
        case JsonValue::value_t::boolean:
            return types::FieldValue(value.get<bool>());
        case JsonValue::value_t::number_integer:
            return types::FieldValue(value.get<int64_t>());
        case JsonValue::value_t::number_unsigned: {
            auto unsigned_value = value.get<uint64_t>();
            if (unsigned_value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return types::FieldValue(static_cast<double>(unsigned_value));
            }
            return types::FieldValue(static_cast<int64_t>(unsigned_value));
        }
        case JsonValue::value_t::number_float:
            return types::FieldValue(value.get<double>());
        default:
            return std::nullopt;
    }
}

} // namespace importer
} // namespace tsimport
