#include "write_strategy.hpp"
#include "line_protocol_parser.hpp"
#include "core/exceptions.hpp"
#include "utils/logger.hpp"
#include <map>
#include <memory>

namespace tsimport {
namespace importer {

namespace {

std::string join_lines(const std::vector<std::string>& lines) {
    std::string body;
    for (const auto& line : lines) {
        if (!body.empty()) {
            body.push_back('\n');
        }
        body += line;
    }
    return body;
}

} // namespace

void check_response_code(const WriteResponse& response) {
    switch (response.code) {
        case 0:
            return;
        case 1:
            throw WriteError("write failed, code: 1, partial write failure");
        case 2:
            throw WriteError("write failed, code: 2, write failure");
        default:
            throw WriteError("unexpected response code: " + std::to_string(response.code));
    }
}

void RowWriteStrategy::write_lines(const utils::RequestContext& ctx, const WriteTarget& target,
                                   const std::vector<std::string>& lines) {
    client_.write(ctx, target.database, target.retention_policy, join_lines(lines), target.precision);
}

void RowWriteStrategy::write_points(const utils::RequestContext& ctx, const WriteTarget& target,
                                    const std::vector<types::Point>& points) {
    std::vector<std::string> lines;
    lines.reserve(points.size());
    for (const auto& point : points) {
        lines.push_back(point.to_line_protocol());
    }
    client_.write(ctx, target.database, target.retention_policy, join_lines(lines), "ns");
}

ColumnWriteStrategy::ColumnWriteStrategy(ColumnWriteClient& client, std::string username, std::string password)
    : client_(client), username_(std::move(username)), password_(std::move(password)) {}

void ColumnWriteStrategy::write_lines(const utils::RequestContext& ctx, const WriteTarget& target,
                                      const std::vector<std::string>& lines) {
    LineProtocolParser parser(join_lines(lines));
    write_points(ctx, target, parser.parse(target.time_multiplier));
}

void ColumnWriteStrategy::write_points(const utils::RequestContext& ctx, const WriteTarget& target,
                                       const std::vector<types::Point>& points) {
    auto& builder = registry_.get_or_create(target.database, target.retention_policy);

    std::map<std::string, std::unique_ptr<RecordBuilder>> record_builders;
    std::vector<RecordLine> lines;
    lines.reserve(points.size());
    for (const auto& point : points) {
        auto& record_builder = record_builders[point.measurement];
        if (!record_builder) {
            record_builder = std::make_unique<RecordBuilder>(point.measurement);
        }
        auto line_builder = record_builder->new_line();
        for (const auto& [key, value] : point.tags) {
            line_builder.add_tag(key, value);
        }
        line_builder.add_fields(point.fields);
        lines.push_back(line_builder.build(point.timestamp));
    }

    WriteRequest request = builder.authenticate(username_, password_).add_record(lines).build();
    TSIMPORT_LOG_TRACE("Column write {}.{}: {} records, {} lines", request.database,
                       request.retention_policy, request.records.size(), request.line_count());
    check_response_code(client_.write(ctx, request));
}

} // namespace importer
} // namespace tsimport
