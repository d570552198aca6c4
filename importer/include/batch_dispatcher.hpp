#pragma once

#include "import_context.hpp"
#include "write_strategy.hpp"
#include "utils/request_context.hpp"
#include <memory>
#include <string>
#include <cstdint>

namespace tsimport {
namespace importer {

struct DispatchStats {
    size_t batches_written = 0;
    size_t batches_failed = 0;
    size_t units_written = 0;
    size_t units_dropped = 0;
};

// Moves buffered units from the ImportContext to the store. Delivery is
// at-most-once: a batch is removed from the buffer whether or not the
// write succeeds.
class BatchDispatcher {
public:
    BatchDispatcher(std::unique_ptr<WriteStrategy> strategy, std::string precision, int64_t time_multiplier);

    // Writes whichever buffer reached the batch size; rethrows the write error
    void flush(ImportContext& context, const utils::RequestContext& ctx);

    // Writes everything still buffered. Every batch is attempted; failures
    // are combined into a single WriteError.
    void drain(ImportContext& context, const utils::RequestContext& ctx);

    const DispatchStats& stats() const { return stats_; }
    const WriteStrategy& strategy() const { return *strategy_; }

private:
    void flush_lines(ImportContext& context, const utils::RequestContext& ctx);
    void flush_points(ImportContext& context, const utils::RequestContext& ctx);
    WriteTarget target_for(const ImportContext& context) const;
    void record_failure(const WriteTarget& target, size_t units, const std::exception& e);

    std::unique_ptr<WriteStrategy> strategy_;
    std::string precision_;
    int64_t time_multiplier_;
    DispatchStats stats_;
};

} // namespace importer
} // namespace tsimport
