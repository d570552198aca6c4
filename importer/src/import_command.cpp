#include "import_command.hpp"
#include "line_protocol_adapter.hpp"
#include "csv_adapter.hpp"
#include "csv_reader.hpp"
#include "json_influx_adapter.hpp"
#include "json_prom_adapter.hpp"
#include "json_document.hpp"
#include "core/exceptions.hpp"
#include "utils/logger.hpp"
#include <fstream>

namespace tsimport {
namespace importer {

namespace {

types::ImportFormat resolve_format(config::ImportConfig& config) {
    config::ConfigManager::validate_import_config(config);
    auto format = types::format_from_string(config.format);
    if (!format) {
        throw ConfigurationError("unknown format " + config.format +
                                 ", only support line_protocol, csv, jsoni, jsonp");
    }
    return *format;
}

bool resolve_column_write(types::ImportFormat format, bool configured) {
    switch (format) {
        case types::ImportFormat::CSV: return true;
        case types::ImportFormat::JSON_INFLUX:
        case types::ImportFormat::JSON_PROM: return false;
        default: return configured;
    }
}

} // namespace

ImportCommand::ImportCommand(config::ImportConfig config,
                             QueryClient& query_client,
                             RowWriteClient& row_client,
                             ColumnWriteClient* column_client,
                             const std::string& username,
                             const std::string& password)
    : config_(std::move(config)),
      format_(resolve_format(config_)),
      column_write_(resolve_column_write(format_, config_.column_write)),
      query_client_(query_client),
      context_(static_cast<size_t>(config_.batch_size)) {
    std::unique_ptr<WriteStrategy> strategy;
    if (column_write_) {
        if (!column_client) {
            throw ConfigurationError("column write selected for format " + config_.format +
                                     " but no column write client is available");
        }
        strategy = std::make_unique<ColumnWriteStrategy>(*column_client, username, password);
    } else {
        strategy = std::make_unique<RowWriteStrategy>(row_client);
    }
    dispatcher_ = std::make_unique<BatchDispatcher>(std::move(strategy), config_.precision,
                                                    config_.time_multiplier);
}

ImportStats ImportCommand::run(const utils::RequestContext& ctx) {
    std::ifstream input(config_.path, std::ios::binary);
    if (config_.path.empty() || !input.is_open()) {
        throw ImportException("failed to open import file: " + config_.path);
    }
    return run(input, ctx);
}

ImportStats ImportCommand::run(std::istream& input, const utils::RequestContext& ctx) {
    TSIMPORT_SCOPED_TIMER("import " + config_.path);
    utils::ImportLogger::log_file_started(config_.path, config_.format, column_write_,
                                          static_cast<size_t>(config_.batch_size));

    switch (format_) {
        case types::ImportFormat::LINE_PROTOCOL:
            import_lines(input, ctx);
            break;
        case types::ImportFormat::CSV:
            import_csv(input, ctx);
            break;
        case types::ImportFormat::JSON_INFLUX:
        case types::ImportFormat::JSON_PROM:
            import_json(input, ctx);
            break;
    }

    finish(ctx);
    return stats_;
}

template<typename Fn>
void ImportCommand::handle_unit(const utils::RequestContext& ctx, bool header_unit, Fn&& process) {
    stats_.units_read++;
    size_t enqueued_before = context_.total_enqueued();
    try {
        Action action = process();
        if (action.is_none() && context_.total_enqueued() == enqueued_before) {
            stats_.units_skipped++;
        }
        execute(action, ctx);
    } catch (const ConfigurationError& e) {
        if (header_unit) {
            TSIMPORT_LOG_ERROR("Header rejected, aborting import of {}: {}", config_.path, e.what());
            throw;
        }
        stats_.units_failed++;
        utils::ImportLogger::log_unit_failed(phase_to_string(context_.phase()), stats_.units_read, e.what());
    } catch (const std::exception& e) {
        stats_.units_failed++;
        utils::ImportLogger::log_unit_failed(phase_to_string(context_.phase()), stats_.units_read, e.what());
    }
}

void ImportCommand::execute(const Action& action, const utils::RequestContext& ctx) {
    switch (action.kind) {
        case Action::Kind::NONE:
            return;
        case Action::Kind::QUERY:
            try {
                query_client_.query(ctx, action.command);
                stats_.queries_executed++;
                utils::ImportLogger::log_ddl_executed(action.command);
            } catch (const std::exception& e) {
                stats_.units_failed++;
                utils::ImportLogger::log_ddl_failed(action.command, e.what());
            }
            return;
        case Action::Kind::FLUSH:
            try {
                dispatcher_->flush(context_, ctx);
            } catch (const std::exception& e) {
                // Dispatcher already logged and counted the dropped batch
                TSIMPORT_LOG_DEBUG("Continuing after failed flush: {}", e.what());
            }
            return;
    }
}

void ImportCommand::import_lines(std::istream& input, const utils::RequestContext& ctx) {
    LineProtocolAdapter adapter(context_);
    std::string line;
    while (!ctx.done()) {
        if (!std::getline(input, line)) {
            return;
        }
        handle_unit(ctx, false, [&adapter, &line]() { return adapter.process(line); });
    }
    stats_.cancelled = true;
}

void ImportCommand::import_csv(std::istream& input, const utils::RequestContext& ctx) {
    CsvAdapter adapter(context_, config_);
    CsvReader reader(input);
    while (!ctx.done()) {
        std::vector<std::string> row;
        try {
            if (!reader.read_row(row)) {
                return;
            }
        } catch (const ParseError& e) {
            stats_.units_read++;
            stats_.units_failed++;
            utils::ImportLogger::log_unit_failed(phase_to_string(context_.phase()), stats_.units_read, e.what());
            continue;
        }
        bool header_unit = context_.phase() == ImportPhase::DDL;
        handle_unit(ctx, header_unit, [&adapter, &row]() { return adapter.process(std::move(row)); });
    }
    stats_.cancelled = true;
}

void ImportCommand::import_json(std::istream& input, const utils::RequestContext& ctx) {
    JsonValue document = JsonDocument::parse(input);

    bool influx = format_ == types::ImportFormat::JSON_INFLUX;
    const char* key = influx ? JsonInfluxAdapter::ARRAY_KEY : JsonPromAdapter::ARRAY_KEY;
    auto arrays = JsonDocument::find_arrays(document, key);
    if (arrays.empty()) {
        TSIMPORT_LOG_WARN("No '{}' array found in {}", key, config_.path);
        return;
    }

    JsonInfluxAdapter influx_adapter(context_, config_);
    JsonPromAdapter prom_adapter(context_, config_);

    execute(influx ? influx_adapter.process_header() : prom_adapter.process_header(), ctx);

    for (const auto* array : arrays) {
        for (const auto& element : *array) {
            if (ctx.done()) {
                stats_.cancelled = true;
                return;
            }
            handle_unit(ctx, false, [&]() {
                return influx ? influx_adapter.process(element) : prom_adapter.process(element);
            });
        }
    }
}

void ImportCommand::finish(const utils::RequestContext& ctx) {
    if (stats_.cancelled) {
        TSIMPORT_LOG_WARN("Import of {} cancelled, flushing pending units", config_.path);
    }

    try {
        dispatcher_->drain(context_, ctx);
    } catch (const std::exception& e) {
        TSIMPORT_LOG_ERROR("Final flush failed: {}", e.what());
    }

    const auto& dispatch = dispatcher_->stats();
    stats_.points_enqueued = context_.total_enqueued();
    stats_.batches_written = dispatch.batches_written;
    stats_.batches_failed = dispatch.batches_failed;
    stats_.units_written = dispatch.units_written;
    stats_.units_dropped = dispatch.units_dropped;

    utils::ImportLogger::log_import_finished(config_.path, stats_.units_read, stats_.units_written,
                                             stats_.units_failed, stats_.units_dropped);
}

} // namespace importer
} // namespace tsimport
