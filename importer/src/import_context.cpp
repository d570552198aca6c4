#include "import_context.hpp"
#include "config/config_manager.hpp"
#include "core/exceptions.hpp"
#include <algorithm>
#include <iterator>

namespace tsimport {
namespace importer {

std::string phase_to_string(ImportPhase phase) {
    return phase == ImportPhase::DDL ? "DDL" : "DML";
}

ImportContext::ImportContext(size_t batch_size)
    : batch_size_(batch_size == 0 ? static_cast<size_t>(config::DEFAULT_BATCH_SIZE) : batch_size) {}

void ImportContext::enter_ddl() {
    phase_ = ImportPhase::DDL;
}

void ImportContext::enter_dml() {
    phase_ = ImportPhase::DML;
    retention_policy_ = config::DEFAULT_RETENTION_POLICY;
}

void ImportContext::set_retention_policy(const std::string& retention_policy) {
    retention_policy_ = retention_policy.empty() ? config::DEFAULT_RETENTION_POLICY : retention_policy;
}

void ImportContext::clear_schema() {
    tag_map_.clear();
    field_map_.clear();
    time_field_ = types::FieldPos();
}

void ImportContext::require_database(const std::string& hint) const {
    if (database_.empty()) {
        throw ConfigurationError(hint.empty() ? "database is required" : "database is required, " + hint);
    }
}

Action ImportContext::after_enqueue() const {
    if (lines_full() || points_full()) {
        return Action::flush();
    }
    return Action::none();
}

Action ImportContext::enqueue_line(std::string line) {
    line_buffer_.push_back(std::move(line));
    total_enqueued_++;
    return after_enqueue();
}

Action ImportContext::enqueue_lines(std::vector<std::string> lines) {
    total_enqueued_ += lines.size();
    std::move(lines.begin(), lines.end(), std::back_inserter(line_buffer_));
    return after_enqueue();
}

Action ImportContext::enqueue_point(types::Point point) {
    point_buffer_.push_back(std::move(point));
    total_enqueued_++;
    return after_enqueue();
}

std::vector<std::string> ImportContext::take_line_batch() {
    size_t count = std::min(batch_size_, line_buffer_.size());
    auto last = line_buffer_.begin() + static_cast<std::ptrdiff_t>(count);
    std::vector<std::string> batch(std::make_move_iterator(line_buffer_.begin()),
                                   std::make_move_iterator(last));
    line_buffer_.erase(line_buffer_.begin(), last);
    return batch;
}

std::vector<types::Point> ImportContext::take_points() {
    std::vector<types::Point> points;
    points.swap(point_buffer_);
    return points;
}

} // namespace importer
} // namespace tsimport
