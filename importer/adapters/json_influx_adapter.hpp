#pragma once

#include "import_context.hpp"
#include "json_document.hpp"
#include "config/config_manager.hpp"
#include <map>
#include <string>
#include <vector>

namespace tsimport {
namespace importer {

// One element of an InfluxQL "series" array
struct InfluxSeries {
    std::string name;
    std::map<std::string, std::string> tags;
    std::vector<std::string> columns;
    std::vector<std::vector<types::OptionalValue>> values;

    // Throws ParseError when the element does not have this shape
    static InfluxSeries from_json(const JsonValue& json);
};

// InfluxQL query output ({"results":[{"series":[...]}]}) back into protocol lines
class JsonInfluxAdapter {
public:
    static constexpr const char* ARRAY_KEY = "series";
    static constexpr const char* TIME_COLUMN = "time";

    JsonInfluxAdapter(ImportContext& context, const config::ImportConfig& config);

    // Called when the first series array is found
    Action process_header();

    Action process(const JsonValue& element);

    // Protocol lines for every row; rows without fields are skipped
    std::vector<std::string> to_lines(const InfluxSeries& series);

private:
    ImportContext& context_;
    const config::ImportConfig& config_;
};

} // namespace importer
} // namespace tsimport
