#include <gtest/gtest.h>
#include "write_request.hpp"
#include "core/exceptions.hpp"

using namespace tsimport;
using namespace tsimport::importer;
using namespace tsimport::types;

class WriteRequestBuilderTest : public ::testing::Test {
protected:
    RecordLine cpu_line(const std::string& host, FieldValue usage, Timestamp ts) {
        return RecordBuilder("cpu").new_line().add_tag("host", host).add_field("usage", std::move(usage)).build(ts);
    }

    WriteRequestBuilder builder{"db", "autogen"};
};

TEST_F(WriteRequestBuilderTest, BuildsColumnOrientedRecord) {
    auto line_a = cpu_line("a", 0.5, 20);
    auto line_b = RecordBuilder("cpu").new_line().add_field("idle", true).build(10);

    WriteRequest request = builder.authenticate("user", "pw")
                               .add_record(std::vector<RecordLine>{line_a, line_b})
                               .build();

    EXPECT_EQ(request.database, "db");
    EXPECT_EQ(request.retention_policy, "autogen");
    EXPECT_EQ(request.username, "user");
    EXPECT_EQ(request.password, "pw");
    ASSERT_EQ(request.records.size(), 1u);

    const Record& record = request.records[0];
    EXPECT_EQ(record.measurement, "cpu");
    EXPECT_EQ(record.row_count, 2u);
    EXPECT_EQ(record.min_time, 10);
    EXPECT_EQ(record.max_time, 20);

    // tags, then fields, then time
    ASSERT_EQ(record.columns.size(), 4u);
    EXPECT_EQ(record.columns[0].name, "host");
    EXPECT_EQ(record.columns[0].type, ColumnType::TAG);
    EXPECT_EQ(record.columns[1].name, "idle");
    EXPECT_EQ(record.columns[1].type, ColumnType::BOOLEAN);
    EXPECT_EQ(record.columns[2].name, "usage");
    EXPECT_EQ(record.columns[2].type, ColumnType::FLOAT);
    EXPECT_EQ(record.columns[3].name, "time");
    EXPECT_EQ(record.columns[3].type, ColumnType::TIMESTAMP);

    const Column* host = record.find_column("host");
    ASSERT_NE(host, nullptr);
    EXPECT_EQ(std::get<std::string>(*host->values[0]), "a");
    EXPECT_FALSE(host->values[1].has_value());

    const Column* usage = record.find_column("usage");
    ASSERT_NE(usage, nullptr);
    EXPECT_EQ(std::get<double>(*usage->values[0]), 0.5);
    EXPECT_FALSE(usage->values[1].has_value());
    EXPECT_EQ(record.find_column("missing"), nullptr);
}

TEST_F(WriteRequestBuilderTest, GroupsByMeasurementInFirstSeenOrder) {
    builder.add_record(RecordBuilder("mem").new_line().add_field("used", int64_t(1)).build(1));
    builder.add_record(cpu_line("a", 1.0, 2));
    builder.add_record(RecordBuilder("mem").new_line().add_field("used", int64_t(2)).build(3));

    WriteRequest request = builder.build();

    ASSERT_EQ(request.records.size(), 2u);
    EXPECT_EQ(request.records[0].measurement, "mem");
    EXPECT_EQ(request.records[0].row_count, 2u);
    EXPECT_EQ(request.records[1].measurement, "cpu");
    EXPECT_EQ(request.line_count(), 3u);
}

TEST_F(WriteRequestBuilderTest, BuildResetsPendingLines) {
    builder.add_record(cpu_line("a", 1.0, 1));
    EXPECT_EQ(builder.pending_lines(), 1u);

    builder.build();
    EXPECT_EQ(builder.pending_lines(), 0u);

    try {
        builder.build();
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(std::string(e.what()), "no records to write");
    }
}

TEST_F(WriteRequestBuilderTest, FieldTypeConflictIsRejected) {
    builder.add_record(cpu_line("a", 1.0, 1));
    builder.add_record(cpu_line("b", std::string("high"), 2));

    EXPECT_THROW(builder.build(), ConfigurationError);
    EXPECT_EQ(builder.pending_lines(), 0u);
}

TEST(WriteRequestBuilderValidationTest, RequiresDatabaseAndMeasurement) {
    EXPECT_THROW(WriteRequestBuilder("", "autogen"), ConfigurationError);
    EXPECT_THROW(RecordBuilder(""), ConfigurationError);
}

TEST(WriteRequestBuilderRegistryTest, CreatesOneBuilderPerTarget) {
    WriteRequestBuilderRegistry registry;

    auto& first = registry.get_or_create("db", "autogen");
    auto& again = registry.get_or_create("db", "autogen");
    auto& other = registry.get_or_create("db", "weekly");

    EXPECT_EQ(&first, &again);
    EXPECT_NE(&first, &other);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_TRUE(registry.contains("db", "weekly"));
    EXPECT_FALSE(registry.contains("other", "autogen"));
    EXPECT_EQ(WriteRequestBuilderRegistry::key_for("db", "autogen"), "db.autogen");
}

TEST(WriteRequestBuilderRegistryTest, EmptyDatabaseIsNotRegistered) {
    WriteRequestBuilderRegistry registry;
    EXPECT_THROW(registry.get_or_create("", "autogen"), ConfigurationError);
    EXPECT_EQ(registry.size(), 0u);
}
