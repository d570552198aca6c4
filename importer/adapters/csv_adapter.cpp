#include "csv_adapter.hpp"
#include "value_coercion.hpp"
#include "core/exceptions.hpp"
#include "utils/logger.hpp"
#include <algorithm>

namespace tsimport {
namespace importer {

namespace {

const std::string UTF8_BOM = "\xEF\xBB\xBF";

} // namespace

CsvAdapter::CsvAdapter(ImportContext& context, const config::ImportConfig& config)
    : context_(context), config_(config) {}

void CsvAdapter::strip_bom(std::string& cell) {
    if (cell.compare(0, UTF8_BOM.size(), UTF8_BOM) == 0) {
        cell.erase(0, UTF8_BOM.size());
    }
}

Action CsvAdapter::process(std::vector<std::string> row) {
    if (row.empty()) {
        return Action::none();
    }
    if (context_.phase() == ImportPhase::DDL) {
        return process_header(row);
    }
    return process_row(row);
}

Action CsvAdapter::process_header(std::vector<std::string>& header) {
    strip_bom(header[0]);

    context_.set_database(config_.database);
    context_.set_retention_policy(config_.retention_policy);
    context_.set_measurement(config_.measurement);
    context_.clear_schema();

    auto& tag_map = context_.tag_map();
    auto& field_map = context_.field_map();
    for (const auto& tag : config_.tags) {
        tag_map[tag] = types::FieldPos();
    }
    for (const auto& field : config_.fields) {
        field_map[field] = types::FieldPos();
    }

    for (size_t idx = 0; idx < header.size(); ++idx) {
        const std::string& name = header[idx];
        int pos = static_cast<int>(idx);
        if (tag_map.count(name) > 0) {
            tag_map[name] = types::FieldPos(name, pos);
            continue;
        }
        if (field_map.count(name) > 0) {
            field_map[name] = types::FieldPos(name, pos);
            continue;
        }
        if (name == config_.time_field) {
            context_.time_field() = types::FieldPos(name, pos);
            continue;
        }
        if (config_.fields.empty()) {
            field_map[name] = types::FieldPos(name, pos);
        } else {
            TSIMPORT_LOG_DEBUG("Ignoring csv column '{}'", name);
        }
    }

    validate_mapping();

    max_position_ = context_.time_field().pos;
    for (const auto& [name, pos] : tag_map) {
        max_position_ = std::max(max_position_, pos.pos);
    }
    for (const auto& [name, pos] : field_map) {
        max_position_ = std::max(max_position_, pos.pos);
    }

    context_.enter_dml();
    context_.set_retention_policy(config_.retention_policy);

    if (context_.database().empty()) {
        TSIMPORT_LOG_WARN("No database configured, skipping CREATE DATABASE");
        return Action::none();
    }
    return Action::query("CREATE DATABASE " + context_.database());
}

void CsvAdapter::validate_mapping() const {
    const auto& tag_map = context_.tag_map();
    const auto& field_map = context_.field_map();

    for (const auto& field : config_.fields) {
        if (tag_map.count(field) > 0) {
            throw ConfigurationError(field + " is in both tags and fields");
        }
        auto it = field_map.find(field);
        if (it == field_map.end() || !it->second.resolved()) {
            throw ConfigurationError("field name (" + field + ") not in csv header");
        }
    }
    for (const auto& tag : config_.tags) {
        auto it = tag_map.find(tag);
        if (it == tag_map.end() || !it->second.resolved()) {
            throw ConfigurationError("tag name (" + tag + ") not in csv header");
        }
    }
    if (!context_.time_field().resolved()) {
        throw ConfigurationError("time name not in csv header: " + config_.time_field);
    }
}

Action CsvAdapter::process_row(const std::vector<std::string>& row) {
    context_.require_database("set `database` in the import configuration");
    if (context_.measurement().empty()) {
        throw ConfigurationError("measurement is required");
    }
    if (context_.field_map().empty()) {
        throw ConfigurationError("field is required");
    }
    if (static_cast<int>(row.size()) <= max_position_) {
        throw ParseError("csv row has " + std::to_string(row.size()) + " columns, expected at least " +
                         std::to_string(max_position_ + 1));
    }

    types::Point point(context_.measurement());
    for (const auto& [name, pos] : context_.tag_map()) {
        point.add_tag(name, row[pos.pos]);
    }
    for (const auto& [name, pos] : context_.field_map()) {
        point.add_field(name, row[pos.pos]);
    }
    point.set_timestamp(parse_timestamp_best_effort(row[context_.time_field().pos], config_.time_multiplier));

    return context_.enqueue_point(std::move(point));
}

} // namespace importer
} // namespace tsimport
