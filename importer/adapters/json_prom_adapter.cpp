#include "json_prom_adapter.hpp"
#include "value_coercion.hpp"
#include "core/exceptions.hpp"
#include "utils/logger.hpp"
#include <cmath>
#include <cstdlib>

namespace tsimport {
namespace importer {

namespace {

constexpr double NANOS_PER_SECOND = 1e9;

PromSample decode_sample(const JsonValue& pair) {
    if (!pair.is_array() || pair.size() != 2) {
        throw ParseError("prometheus sample is not a [timestamp, value] pair");
    }

    PromSample sample;
    const auto& ts = pair[0];
    if (ts.is_number()) {
        sample.timestamp_seconds = ts.get<double>();
    } else if (ts.is_string()) {
        const std::string text = ts.get<std::string>();
        char* end = nullptr;
        sample.timestamp_seconds = std::strtod(text.c_str(), &end);
        if (text.empty() || end != text.c_str() + text.size()) {
            throw ParseError("invalid prometheus sample timestamp: " + text);
        }
    } else {
        throw ParseError("invalid prometheus sample timestamp: " + ts.dump());
    }

    const auto& value = pair[1];
    if (value.is_string()) {
        sample.value = value.get<std::string>();
    } else {
        sample.value = field_to_string(to_optional_value(value));
    }
    return sample;
}

} // namespace

PromSeries PromSeries::from_json(const JsonValue& json) {
    if (!json.is_object()) {
        throw ParseError("result element is not an object");
    }

    PromSeries series;
    if (json.contains("metric") && json["metric"].is_object()) {
        const auto& metric = json["metric"];
        for (auto it = metric.begin(); it != metric.end(); ++it) {
            series.metric[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
        }
    }
    if (json.contains("values") && json["values"].is_array()) {
        for (const auto& pair : json["values"]) {
            series.samples.push_back(decode_sample(pair));
        }
    } else if (json.contains("value")) {
        series.samples.push_back(decode_sample(json["value"]));
    } else {
        throw ParseError("result element has neither values nor value");
    }
    return series;
}

JsonPromAdapter::JsonPromAdapter(ImportContext& context, const config::ImportConfig& config)
    : context_(context), config_(config),
      field_name_(config.fields.empty() ? DEFAULT_FIELD : config.fields.front()) {}

Action JsonPromAdapter::process_header() {
    context_.enter_dml();
    context_.set_database(config_.database);
    context_.set_retention_policy(config_.retention_policy);
    context_.set_measurement(config_.measurement);

    context_.clear_schema();
    for (const auto& tag : config_.tags) {
        context_.tag_map()[tag] = types::FieldPos();
    }
    context_.field_map()[field_name_] = types::FieldPos();

    if (context_.database().empty()) {
        return Action::none();
    }
    return Action::query("CREATE DATABASE " + context_.database());
}

std::vector<std::string> JsonPromAdapter::to_lines(const PromSeries& series) const {
    std::string prefix = types::line_protocol::escape_measurement(context_.measurement());
    auto append_tag = [&prefix](const std::string& key, const std::string& value) {
        if (!value.empty()) {
            prefix += "," + types::line_protocol::escape_key(key) + "=" + types::line_protocol::escape_key(value);
        }
    };
    if (context_.tag_map().empty()) {
        for (const auto& [key, value] : series.metric) {
            append_tag(key, value);
        }
    } else {
        for (const auto& [key, pos] : context_.tag_map()) {
            auto it = series.metric.find(key);
            if (it != series.metric.end()) {
                append_tag(key, it->second);
            }
        }
    }

    const std::string field_prefix = " " + types::line_protocol::escape_key(field_name_) + "=";
    const double multiplier = static_cast<double>(config_.time_multiplier > 0 ? config_.time_multiplier : 1);

    std::vector<std::string> lines;
    lines.reserve(series.samples.size());
    for (const auto& sample : series.samples) {
        auto timestamp = truncate_to_int64(std::round(sample.timestamp_seconds * NANOS_PER_SECOND / multiplier));
        if (!timestamp) {
            throw ParseError("prometheus sample timestamp out of range: " +
                             types::line_protocol::format_float(sample.timestamp_seconds));
        }
        lines.push_back(prefix + field_prefix + sample.value + " " + std::to_string(*timestamp));
    }
    return lines;
}

Action JsonPromAdapter::process(const JsonValue& element) {
    PromSeries series = PromSeries::from_json(element);
    context_.require_database("set `database` in the import configuration");
    if (context_.measurement().empty()) {
        throw ConfigurationError("measurement is required");
    }

    std::vector<std::string> lines = to_lines(series);
    if (lines.empty()) {
        return Action::none();
    }
    return context_.enqueue_lines(std::move(lines));
}

} // namespace importer
} // namespace tsimport
