#pragma once

#include "types/common_types.hpp"
#include <string>
#include <vector>
#include <map>
#include <cstddef>

namespace tsimport {
namespace importer {

enum class ImportPhase {
    DDL,
    DML
};

std::string phase_to_string(ImportPhase phase);

// Side effect requested by an adapter; the driver carries it out
struct Action {
    enum class Kind {
        NONE,
        QUERY,
        FLUSH
    };

    Kind kind = Kind::NONE;
    std::string command;

    static Action none() { return Action{}; }
    static Action query(std::string statement) { return Action{Kind::QUERY, std::move(statement)}; }
    static Action flush() { return Action{Kind::FLUSH, {}}; }

    bool is_none() const { return kind == Kind::NONE; }
};

// Mutable per-import state shared by the format adapters and the dispatcher.
// Buffers hold either raw protocol lines or decoded points; a flush is
// requested once either reaches the batch size.
class ImportContext {
public:
    explicit ImportContext(size_t batch_size);

    ImportPhase phase() const { return phase_; }
    void enter_ddl();
    // Switching to DML resets the retention policy to autogen
    void enter_dml();

    const std::string& database() const { return database_; }
    const std::string& retention_policy() const { return retention_policy_; }
    const std::string& measurement() const { return measurement_; }
    void set_database(const std::string& database) { database_ = database; }
    void set_retention_policy(const std::string& retention_policy);
    void set_measurement(const std::string& measurement) { measurement_ = measurement; }

    std::map<std::string, types::FieldPos>& tag_map() { return tag_map_; }
    std::map<std::string, types::FieldPos>& field_map() { return field_map_; }
    types::FieldPos& time_field() { return time_field_; }
    const std::map<std::string, types::FieldPos>& tag_map() const { return tag_map_; }
    const std::map<std::string, types::FieldPos>& field_map() const { return field_map_; }
    const types::FieldPos& time_field() const { return time_field_; }
    void clear_schema();

    // Throws ConfigurationError with the given remediation hint when no database is set
    void require_database(const std::string& hint = "") const;

    Action enqueue_line(std::string line);
    Action enqueue_lines(std::vector<std::string> lines);
    Action enqueue_point(types::Point point);

    // First min(batch_size, pending) lines, removed from the buffer
    std::vector<std::string> take_line_batch();
    // Entire point buffer
    std::vector<types::Point> take_points();

    size_t pending_lines() const { return line_buffer_.size(); }
    size_t pending_points() const { return point_buffer_.size(); }
    bool has_pending() const { return !line_buffer_.empty() || !point_buffer_.empty(); }
    bool lines_full() const { return line_buffer_.size() >= batch_size_; }
    bool points_full() const { return point_buffer_.size() >= batch_size_; }
    size_t batch_size() const { return batch_size_; }
    // Units ever enqueued into either buffer
    size_t total_enqueued() const { return total_enqueued_; }

private:
    Action after_enqueue() const;

    size_t batch_size_;
    ImportPhase phase_ = ImportPhase::DDL;
    std::string database_;
    std::string retention_policy_;
    std::string measurement_;
    std::map<std::string, types::FieldPos> tag_map_;
    std::map<std::string, types::FieldPos> field_map_;
    types::FieldPos time_field_;

    std::vector<std::string> line_buffer_;
    std::vector<types::Point> point_buffer_;
    size_t total_enqueued_ = 0;
};

} // namespace importer
} // namespace tsimport
