#include "batch_dispatcher.hpp"
#include "core/exceptions.hpp"
#include "utils/logger.hpp"
#include <vector>

namespace tsimport {
namespace importer {

BatchDispatcher::BatchDispatcher(std::unique_ptr<WriteStrategy> strategy, std::string precision,
                                 int64_t time_multiplier)
    : strategy_(std::move(strategy)), precision_(std::move(precision)), time_multiplier_(time_multiplier) {}

WriteTarget BatchDispatcher::target_for(const ImportContext& context) const {
    return WriteTarget{context.database(), context.retention_policy(), precision_, time_multiplier_};
}

void BatchDispatcher::record_failure(const WriteTarget& target, size_t units, const std::exception& e) {
    stats_.batches_failed++;
    stats_.units_dropped += units;
    utils::ImportLogger::log_batch_failed(target.database, target.retention_policy, units, e.what());
}

void BatchDispatcher::flush_lines(ImportContext& context, const utils::RequestContext& ctx) {
    WriteTarget target = target_for(context);
    std::vector<std::string> batch = context.take_line_batch();
    if (batch.empty()) {
        return;
    }
    try {
        strategy_->write_lines(ctx, target, batch);
    } catch (const std::exception& e) {
        record_failure(target, batch.size(), e);
        throw;
    }
    stats_.batches_written++;
    stats_.units_written += batch.size();
    utils::ImportLogger::log_batch_flushed(target.database, target.retention_policy, batch.size(),
                                           strategy_->name());
}

void BatchDispatcher::flush_points(ImportContext& context, const utils::RequestContext& ctx) {
    WriteTarget target = target_for(context);
    std::vector<types::Point> points = context.take_points();
    if (points.empty()) {
        return;
    }
    try {
        strategy_->write_points(ctx, target, points);
    } catch (const std::exception& e) {
        record_failure(target, points.size(), e);
        throw;
    }
    stats_.batches_written++;
    stats_.units_written += points.size();
    utils::ImportLogger::log_batch_flushed(target.database, target.retention_policy, points.size(),
                                           strategy_->name());
}

void BatchDispatcher::flush(ImportContext& context, const utils::RequestContext& ctx) {
    if (context.lines_full()) {
        flush_lines(context, ctx);
    }
    if (context.points_full()) {
        flush_points(context, ctx);
    }
}

void BatchDispatcher::drain(ImportContext& context, const utils::RequestContext& ctx) {
    std::vector<std::string> errors;

    while (context.pending_lines() > 0) {
        try {
            flush_lines(context, ctx);
        } catch (const std::exception& e) {
            errors.emplace_back(e.what());
        }
    }
    if (context.pending_points() > 0) {
        try {
            flush_points(context, ctx);
        } catch (const std::exception& e) {
            errors.emplace_back(e.what());
        }
    }

    if (!errors.empty()) {
        std::string message;
        for (const auto& error : errors) {
            if (!message.empty()) {
                message.push_back('\n');
            }
            message += error;
        }
        throw WriteError(message);
    }
}

} // namespace importer
} // namespace tsimport
