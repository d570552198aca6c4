#pragma once

#include "types/common_types.hpp"
#include <nlohmann/json.hpp>
#include <istream>
#include <string>
#include <vector>

namespace tsimport {
namespace importer {

using JsonValue = nlohmann::ordered_json;

// Whole-document JSON input, members kept in document order
class JsonDocument {
public:
    // Throws ParseError on malformed JSON
    static JsonValue parse(std::istream& input);

    // Every array-valued member named key, depth first in document order.
    // The returned arrays are not searched further.
    static std::vector<const JsonValue*> find_arrays(const JsonValue& document, const std::string& key);
};

// Decoded scalar; null, objects and arrays have no value
types::OptionalValue to_optional_value(const JsonValue& value);

} // namespace importer
} // namespace tsimport
