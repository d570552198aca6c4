#pragma once

#include "import_context.hpp"
#include "json_document.hpp"
#include "config/config_manager.hpp"
#include <map>
#include <string>
#include <vector>

namespace tsimport {
namespace importer {

struct PromSample {
    double timestamp_seconds = 0;
    std::string value;
};

// One element of a Prometheus "result" array (matrix or vector)
struct PromSeries {
    std::map<std::string, std::string> metric;
    std::vector<PromSample> samples;

    static PromSeries from_json(const JsonValue& json);
};

// Prometheus query API output ({"data":{"result":[...]}}) into protocol lines
class JsonPromAdapter {
public:
    static constexpr const char* ARRAY_KEY = "result";
    static constexpr const char* DEFAULT_FIELD = "value";

    JsonPromAdapter(ImportContext& context, const config::ImportConfig& config);

    Action process_header();
    Action process(const JsonValue& element);

    std::vector<std::string> to_lines(const PromSeries& series) const;

private:
    ImportContext& context_;
    const config::ImportConfig& config_;
    std::string field_name_;
};

} // namespace importer
} // namespace tsimport
