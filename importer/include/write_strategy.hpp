#pragma once

#include "clients.hpp"
#include "write_request.hpp"
#include "types/common_types.hpp"
#include "utils/request_context.hpp"
#include <string>
#include <vector>

namespace tsimport {
namespace importer {

struct WriteTarget {
    std::string database;
    std::string retention_policy;
    std::string precision;
    int64_t time_multiplier = 1;
};

// Maps a column-write response code onto success or WriteError
void check_response_code(const WriteResponse& response);

class WriteStrategy {
public:
    virtual ~WriteStrategy() = default;

    // Raw protocol lines whose timestamps are in target.precision
    virtual void write_lines(const utils::RequestContext& ctx, const WriteTarget& target,
                             const std::vector<std::string>& lines) = 0;

    // Decoded points with nanosecond timestamps
    virtual void write_points(const utils::RequestContext& ctx, const WriteTarget& target,
                              const std::vector<types::Point>& points) = 0;

    virtual std::string name() const = 0;
};

class RowWriteStrategy : public WriteStrategy {
public:
    explicit RowWriteStrategy(RowWriteClient& client) : client_(client) {}

    void write_lines(const utils::RequestContext& ctx, const WriteTarget& target,
                     const std::vector<std::string>& lines) override;

    // Renders points as protocol text at ns precision. ImportCommand never
    // routes a point buffer here: CSV, the only point producer, always uses
    // column write. A dispatcher built directly on this strategy can.
    void write_points(const utils::RequestContext& ctx, const WriteTarget& target,
                      const std::vector<types::Point>& points) override;
    std::string name() const override { return "row"; }

private:
    RowWriteClient& client_;
};

class ColumnWriteStrategy : public WriteStrategy {
public:
    ColumnWriteStrategy(ColumnWriteClient& client, std::string username, std::string password);

    void write_lines(const utils::RequestContext& ctx, const WriteTarget& target,
                     const std::vector<std::string>& lines) override;
    void write_points(const utils::RequestContext& ctx, const WriteTarget& target,
                      const std::vector<types::Point>& points) override;
    std::string name() const override { return "column"; }

    const WriteRequestBuilderRegistry& registry() const { return registry_; }

private:
    ColumnWriteClient& client_;
    std::string username_;
    std::string password_;
    WriteRequestBuilderRegistry registry_;
};

} // namespace importer
} // namespace tsimport
