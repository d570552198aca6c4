#pragma once

#include "types/common_types.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <cstdint>

namespace tsimport {
namespace importer {

enum class ColumnType {
    STRING = 0,
    FLOAT = 1,
    INTEGER = 2,
    BOOLEAN = 3,
    TAG = 4,
    TIMESTAMP = 5
};

std::string column_type_name(ColumnType type);

// One row destined for a column-oriented record
struct RecordLine {
    std::string measurement;
    std::map<std::string, std::string> tags;
    std::map<std::string, types::FieldValue> fields;
    types::Timestamp timestamp = 0;
};

class RecordLineBuilder {
public:
    explicit RecordLineBuilder(std::string measurement);

    RecordLineBuilder& add_tag(const std::string& key, const std::string& value);
    RecordLineBuilder& add_field(const std::string& key, types::FieldValue value);
    RecordLineBuilder& add_fields(const std::map<std::string, types::FieldValue>& fields);
    RecordLine build(types::Timestamp timestamp) const;

private:
    RecordLine line_;
};

// Factory of lines for a single measurement
class RecordBuilder {
public:
    explicit RecordBuilder(std::string measurement);

    RecordLineBuilder new_line() const { return RecordLineBuilder(measurement_); }
    const std::string& measurement() const { return measurement_; }

private:
    std::string measurement_;
};

struct Column {
    std::string name;
    ColumnType type = ColumnType::STRING;
    std::vector<types::OptionalValue> values;
};

// All lines of one measurement, transposed into columns of equal length
struct Record {
    std::string measurement;
    std::vector<Column> columns;
    size_t row_count = 0;
    types::Timestamp min_time = 0;
    types::Timestamp max_time = 0;

    const Column* find_column(const std::string& name) const;
};

struct WriteRequest {
    std::string database;
    std::string retention_policy;
    std::string username;
    std::string password;
    std::vector<Record> records;

    size_t line_count() const;
};

struct WriteResponse {
    uint32_t code = 0;
    std::string message;
};

// Accumulates lines for one database/retention policy and turns them into a
// WriteRequest. Reusable: build() drains the accumulated lines.
class WriteRequestBuilder {
public:
    WriteRequestBuilder(std::string database, std::string retention_policy);

    WriteRequestBuilder& authenticate(const std::string& username, const std::string& password);
    WriteRequestBuilder& add_record(const std::vector<RecordLine>& lines);
    WriteRequestBuilder& add_record(RecordLine line);

    // Throws ConfigurationError when nothing was added or a field changes
    // type within a measurement
    WriteRequest build();

    size_t pending_lines() const { return lines_.size(); }
    const std::string& database() const { return database_; }
    const std::string& retention_policy() const { return retention_policy_; }

private:
    Record build_record(const std::string& measurement, const std::vector<const RecordLine*>& lines) const;

    std::string database_;
    std::string retention_policy_;
    std::string username_;
    std::string password_;
    std::vector<RecordLine> lines_;
};

// Builders keyed by "database.retention_policy", created on first use
class WriteRequestBuilderRegistry {
public:
    WriteRequestBuilder& get_or_create(const std::string& database, const std::string& retention_policy);

    bool contains(const std::string& database, const std::string& retention_policy) const;
    size_t size() const;

    static std::string key_for(const std::string& database, const std::string& retention_policy);

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<WriteRequestBuilder>> builders_;
};

} // namespace importer
} // namespace tsimport
