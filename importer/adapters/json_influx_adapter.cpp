#include "json_influx_adapter.hpp"
#include "value_coercion.hpp"
#include "core/exceptions.hpp"
#include "utils/logger.hpp"

namespace tsimport {
namespace importer {

InfluxSeries InfluxSeries::from_json(const JsonValue& json) {
    if (!json.is_object()) {
        throw ParseError("series element is not an object");
    }

    InfluxSeries series;
    try {
        if (json.contains("name")) {
            series.name = json.at("name").get<std::string>();
        }
        if (json.contains("tags") && !json.at("tags").is_null()) {
            const auto& tags = json.at("tags");
            for (auto it = tags.begin(); it != tags.end(); ++it) {
                series.tags[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
            }
        }
        if (json.contains("columns")) {
            series.columns = json.at("columns").get<std::vector<std::string>>();
        }
        if (json.contains("values")) {
            for (const auto& row : json.at("values")) {
                if (!row.is_array()) {
                    throw ParseError("series row is not an array");
                }
                std::vector<types::OptionalValue> decoded;
                decoded.reserve(row.size());
                for (const auto& cell : row) {
                    decoded.push_back(to_optional_value(cell));
                }
                series.values.push_back(std::move(decoded));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ParseError(std::string("invalid series element: ") + e.what());
    }

    if (series.name.empty()) {
        throw ParseError("series element has no name");
    }
    return series;
}

JsonInfluxAdapter::JsonInfluxAdapter(ImportContext& context, const config::ImportConfig& config)
    : context_(context), config_(config) {}

Action JsonInfluxAdapter::process_header() {
    context_.enter_dml();
    context_.set_database(config_.database);
    context_.set_retention_policy(config_.retention_policy);
    if (context_.database().empty()) {
        return Action::none();
    }
    return Action::query("CREATE DATABASE " + context_.database());
}

std::vector<std::string> JsonInfluxAdapter::to_lines(const InfluxSeries& series) {
    std::string prefix = types::line_protocol::escape_measurement(series.name);
    for (const auto& [key, value] : series.tags) {
        if (value.empty()) {
            continue;
        }
        prefix += "," + types::line_protocol::escape_key(key) + "=" + types::line_protocol::escape_key(value);
    }

    context_.clear_schema();
    for (size_t idx = 0; idx < series.columns.size(); ++idx) {
        const std::string& column = series.columns[idx];
        int pos = static_cast<int>(idx);
        if (column == TIME_COLUMN) {
            context_.time_field() = types::FieldPos(column, pos);
        } else {
            context_.field_map()[column] = types::FieldPos(column, pos);
        }
    }

    std::vector<std::string> lines;
    lines.reserve(series.values.size());
    for (const auto& row : series.values) {
        std::string fields;
        for (size_t idx = 0; idx < series.columns.size() && idx < row.size(); ++idx) {
            if (static_cast<int>(idx) == context_.time_field().pos) {
                continue;
            }
            if (!fields.empty()) {
                fields.push_back(',');
            }
            fields += types::line_protocol::escape_key(series.columns[idx]) + "=" +
                      parse_to_string(row[idx], CoercionKind::FIELD, config_.time_multiplier);
        }
        if (fields.empty()) {
            TSIMPORT_LOG_WARN("Skipping row of series '{}' without fields", series.name);
            continue;
        }

        std::string line = prefix + " " + fields;
        int time_pos = context_.time_field().pos;
        if (time_pos >= 0 && static_cast<size_t>(time_pos) < row.size()) {
            std::string timestamp = parse_to_string(row[time_pos], CoercionKind::TIMESTAMP,
                                                    config_.time_multiplier);
            if (!timestamp.empty()) {
                line += " " + timestamp;
            }
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

Action JsonInfluxAdapter::process(const JsonValue& element) {
    InfluxSeries series = InfluxSeries::from_json(element);
    context_.require_database("set `database` in the import configuration");

    std::vector<std::string> lines = to_lines(series);
    if (lines.empty()) {
        return Action::none();
    }
    return context_.enqueue_lines(std::move(lines));
}

} // namespace importer
} // namespace tsimport
