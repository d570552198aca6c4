#pragma once

#include "batch_dispatcher.hpp"
#include "clients.hpp"
#include "import_context.hpp"
#include "config/config_manager.hpp"
#include "utils/request_context.hpp"
#include <istream>
#include <memory>
#include <string>

namespace tsimport {
namespace importer {

struct ImportStats {
    size_t units_read = 0;
    size_t units_skipped = 0;
    size_t units_failed = 0;
    size_t points_enqueued = 0;
    size_t batches_written = 0;
    size_t batches_failed = 0;
    size_t units_written = 0;
    size_t units_dropped = 0;
    size_t queries_executed = 0;
    bool cancelled = false;
};

// Drives one import: reads units from the input, feeds them through the
// format adapter and carries out the resulting actions.
class ImportCommand {
public:
    // column_client may be null when no column-write transport is available;
    // the credentials authenticate column-write requests
    ImportCommand(config::ImportConfig config,
                  QueryClient& query_client,
                  RowWriteClient& row_client,
                  ColumnWriteClient* column_client,
                  const std::string& username = "",
                  const std::string& password = "");

    // Opens config.path; throws ImportException when it cannot be read.
    // A failed final drain is logged and reflected in the statistics.
    ImportStats run(const utils::RequestContext& ctx);

    ImportStats run(std::istream& input, const utils::RequestContext& ctx);

    types::ImportFormat format() const { return format_; }
    bool uses_column_write() const { return column_write_; }

private:
    void import_lines(std::istream& input, const utils::RequestContext& ctx);
    void import_csv(std::istream& input, const utils::RequestContext& ctx);
    void import_json(std::istream& input, const utils::RequestContext& ctx);

    // Runs one unit through the adapter; header-phase ConfigurationError propagates
    template<typename Fn>
    void handle_unit(const utils::RequestContext& ctx, bool header_unit, Fn&& process);

    void execute(const Action& action, const utils::RequestContext& ctx);
    void finish(const utils::RequestContext& ctx);

    config::ImportConfig config_;
    types::ImportFormat format_;
    bool column_write_;
    QueryClient& query_client_;

    ImportContext context_;
    std::unique_ptr<BatchDispatcher> dispatcher_;
    ImportStats stats_;
};

} // namespace importer
} // namespace tsimport
