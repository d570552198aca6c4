#pragma once

#include "utils/request_context.hpp"
#include "write_request.hpp"
#include <string>

namespace tsimport {
namespace importer {

struct QueryResult {
    long status_code = 0;
    std::string body;
};

// Executes administrative statements (CREATE DATABASE ...)
class QueryClient {
public:
    virtual ~QueryClient() = default;
    virtual QueryResult query(const utils::RequestContext& ctx, const std::string& command) = 0;
};

// Newline-joined protocol text in one request; throws on failure
class RowWriteClient {
public:
    virtual ~RowWriteClient() = default;
    virtual void write(const utils::RequestContext& ctx,
                       const std::string& database,
                       const std::string& retention_policy,
                       const std::string& body,
                       const std::string& precision) = 0;
};

// Column-oriented bulk write; the response code is interpreted by the caller
class ColumnWriteClient {
public:
    virtual ~ColumnWriteClient() = default;
    virtual WriteResponse write(const utils::RequestContext& ctx, const WriteRequest& request) = 0;
};

} // namespace importer
} // namespace tsimport
