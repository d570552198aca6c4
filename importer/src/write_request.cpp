#include "write_request.hpp"
#include "core/exceptions.hpp"
#include <algorithm>
#include <set>

namespace tsimport {
namespace importer {

std::string column_type_name(ColumnType type) {
    switch (type) {
        case ColumnType::STRING: return "string";
        case ColumnType::FLOAT: return "float";
        case ColumnType::INTEGER: return "integer";
        case ColumnType::BOOLEAN: return "boolean";
        case ColumnType::TAG: return "tag";
        case ColumnType::TIMESTAMP: return "timestamp";
        default: return "unknown";
    }
}

RecordLineBuilder::RecordLineBuilder(std::string measurement) {
    line_.measurement = std::move(measurement);
}

RecordLineBuilder& RecordLineBuilder::add_tag(const std::string& key, const std::string& value) {
    line_.tags[key] = value;
    return *this;
}

RecordLineBuilder& RecordLineBuilder::add_field(const std::string& key, types::FieldValue value) {
    line_.fields[key] = std::move(value);
    return *this;
}

RecordLineBuilder& RecordLineBuilder::add_fields(const std::map<std::string, types::FieldValue>& fields) {
    for (const auto& [key, value] : fields) {
        line_.fields[key] = value;
    }
    return *this;
}

RecordLine RecordLineBuilder::build(types::Timestamp timestamp) const {
    RecordLine line = line_;
    line.timestamp = timestamp;
    return line;
}

RecordBuilder::RecordBuilder(std::string measurement) : measurement_(std::move(measurement)) {
    if (measurement_.empty()) {
        throw ConfigurationError("measurement name is required");
    }
}

const Column* Record::find_column(const std::string& name) const {
    auto it = std::find_if(columns.begin(), columns.end(),
                           [&name](const Column& column) { return column.name == name; });
    return it == columns.end() ? nullptr : &*it;
}

size_t WriteRequest::line_count() const {
    size_t count = 0;
    for (const auto& record : records) {
        count += record.row_count;
    }
    return count;
}

WriteRequestBuilder::WriteRequestBuilder(std::string database, std::string retention_policy)
    : database_(std::move(database)), retention_policy_(std::move(retention_policy)) {
    if (database_.empty()) {
        throw ConfigurationError("database name is required for column write");
    }
}

WriteRequestBuilder& WriteRequestBuilder::authenticate(const std::string& username, const std::string& password) {
    username_ = username;
    password_ = password;
    return *this;
}

WriteRequestBuilder& WriteRequestBuilder::add_record(const std::vector<RecordLine>& lines) {
    lines_.insert(lines_.end(), lines.begin(), lines.end());
    return *this;
}

WriteRequestBuilder& WriteRequestBuilder::add_record(RecordLine line) {
    lines_.push_back(std::move(line));
    return *this;
}

Record WriteRequestBuilder::build_record(const std::string& measurement,
                                         const std::vector<const RecordLine*>& lines) const {
    std::set<std::string> tag_names;
    std::map<std::string, ColumnType> field_types;
    for (const auto* line : lines) {
        for (const auto& [key, value] : line->tags) {
            tag_names.insert(key);
        }
        for (const auto& [key, value] : line->fields) {
            auto type = static_cast<ColumnType>(value.index());
            auto [it, inserted] = field_types.emplace(key, type);
            if (!inserted && it->second != type) {
                throw ConfigurationError("field type conflict for " + measurement + "." + key + ": " +
                                         column_type_name(it->second) + " vs " + column_type_name(type));
            }
        }
    }

    Record record;
    record.measurement = measurement;
    record.row_count = lines.size();
    record.min_time = lines.front()->timestamp;
    record.max_time = lines.front()->timestamp;

    for (const auto& name : tag_names) {
        Column column{name, ColumnType::TAG, {}};
        column.values.reserve(lines.size());
        for (const auto* line : lines) {
            auto it = line->tags.find(name);
            if (it == line->tags.end()) {
                column.values.emplace_back(std::nullopt);
            } else {
                column.values.emplace_back(types::FieldValue(it->second));
            }
        }
        record.columns.push_back(std::move(column));
    }

    for (const auto& [name, type] : field_types) {
        Column column{name, type, {}};
        column.values.reserve(lines.size());
        for (const auto* line : lines) {
            auto it = line->fields.find(name);
            if (it == line->fields.end()) {
                column.values.emplace_back(std::nullopt);
            } else {
                column.values.emplace_back(it->second);
            }
        }
        record.columns.push_back(std::move(column));
    }

    Column time_column{"time", ColumnType::TIMESTAMP, {}};
    time_column.values.reserve(lines.size());
    for (const auto* line : lines) {
        time_column.values.emplace_back(types::FieldValue(line->timestamp));
        record.min_time = std::min(record.min_time, line->timestamp);
        record.max_time = std::max(record.max_time, line->timestamp);
    }
    record.columns.push_back(std::move(time_column));

    return record;
}

WriteRequest WriteRequestBuilder::build() {
    if (lines_.empty()) {
        throw ConfigurationError("no records to write");
    }

    // A rejected batch leaves the builder empty
    std::vector<RecordLine> lines;
    lines.swap(lines_);

    // Group by measurement, keeping first-appearance order
    std::vector<std::string> order;
    std::map<std::string, std::vector<const RecordLine*>> groups;
    for (const auto& line : lines) {
        auto& group = groups[line.measurement];
        if (group.empty()) {
            order.push_back(line.measurement);
        }
        group.push_back(&line);
    }

    WriteRequest request;
    request.database = database_;
    request.retention_policy = retention_policy_;
    request.username = username_;
    request.password = password_;
    for (const auto& measurement : order) {
        request.records.push_back(build_record(measurement, groups[measurement]));
    }
    return request;
}

std::string WriteRequestBuilderRegistry::key_for(const std::string& database, const std::string& retention_policy) {
    return database + "." + retention_policy;
}

WriteRequestBuilder& WriteRequestBuilderRegistry::get_or_create(const std::string& database,
                                                                const std::string& retention_policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = key_for(database, retention_policy);
    auto it = builders_.find(key);
    if (it != builders_.end()) {
        return *it->second;
    }
    auto builder = std::make_unique<WriteRequestBuilder>(database, retention_policy);
    auto& ref = *builder;
    builders_.emplace(key, std::move(builder));
    return ref;
}

bool WriteRequestBuilderRegistry::contains(const std::string& database, const std::string& retention_policy) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return builders_.count(key_for(database, retention_policy)) > 0;
}

size_t WriteRequestBuilderRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return builders_.size();
}

} // namespace importer
} // namespace tsimport
