#include <gtest/gtest.h>
#include "json_document.hpp"
#include "json_influx_adapter.hpp"
#include "json_prom_adapter.hpp"
#include "import_context.hpp"
#include "core/exceptions.hpp"
#include <sstream>

using namespace tsimport;
using namespace tsimport::importer;
using namespace tsimport::types;

namespace {

JsonValue parse_json(const std::string& text) {
    std::istringstream input(text);
    return JsonDocument::parse(input);
}

const char* INFLUX_DOCUMENT = R"({
  "results": [
    {
      "statement_id": 0,
      "series": [
        {
          "name": "cpu",
          "tags": {"host": "a"},
          "columns": ["time", "usage", "idle"],
          "values": [[1000, 0.5, true], [2000, null, false]]
        }
      ]
    },
    {
      "statement_id": 1,
      "series": [
        {"name": "mem", "columns": ["time", "used"], "values": [[3000, 7]]}
      ]
    }
  ]
})";

const char* PROM_MATRIX_DOCUMENT = R"({
  "status": "success",
  "data": {
    "resultType": "matrix",
    "result": [
      {
        "metric": {"__name__": "up", "job": "node"},
        "values": [[1435781430, "1"], [1435781445, "0"]]
      }
    ]
  }
})";

} // namespace

// JsonDocument
TEST(JsonDocumentTest, FindsEveryNamedArrayInDocumentOrder) {
    JsonValue document = parse_json(INFLUX_DOCUMENT);
    auto arrays = JsonDocument::find_arrays(document, "series");

    ASSERT_EQ(arrays.size(), 2u);
    EXPECT_EQ((*arrays[0])[0]["name"], "cpu");
    EXPECT_EQ((*arrays[1])[0]["name"], "mem");
}

TEST(JsonDocumentTest, MalformedDocumentIsParseError) {
    EXPECT_THROW(parse_json("{\"results\": ["), ParseError);
}

TEST(JsonDocumentTest, DecodesScalarsIntoVariant) {
    JsonValue values = parse_json(R"(["s", 1.5, 7, true, null, {"a": 1}])");

    EXPECT_EQ(std::get<std::string>(*to_optional_value(values[0])), "s");
    EXPECT_EQ(std::get<double>(*to_optional_value(values[1])), 1.5);
    EXPECT_EQ(std::get<int64_t>(*to_optional_value(values[2])), 7);
    EXPECT_TRUE(std::get<bool>(*to_optional_value(values[3])));
    EXPECT_FALSE(to_optional_value(values[4]).has_value());
    EXPECT_FALSE(to_optional_value(values[5]).has_value());
}

// JSON-Influx
class JsonInfluxAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.format = "jsoni";
        config.database = "db";
    }

    config::ImportConfig config;
    ImportContext context{100};
};

TEST_F(JsonInfluxAdapterTest, HeaderCreatesDatabase) {
    JsonInfluxAdapter adapter(context, config);
    Action action = adapter.process_header();

    EXPECT_EQ(action.kind, Action::Kind::QUERY);
    EXPECT_EQ(action.command, "CREATE DATABASE db");
    EXPECT_EQ(context.phase(), ImportPhase::DML);
    EXPECT_EQ(context.retention_policy(), "autogen");
}

TEST_F(JsonInfluxAdapterTest, SeriesRowsBecomeLines) {
    JsonValue document = parse_json(INFLUX_DOCUMENT);
    JsonInfluxAdapter adapter(context, config);
    adapter.process_header();

    auto arrays = JsonDocument::find_arrays(document, JsonInfluxAdapter::ARRAY_KEY);
    Action action = adapter.process((*arrays[0])[0]);

    EXPECT_TRUE(action.is_none());
    ASSERT_EQ(context.pending_lines(), 2u);
    auto lines = context.take_line_batch();
    EXPECT_EQ(lines[0], "cpu,host=a usage=0.5,idle=true 1000");
    EXPECT_EQ(lines[1], "cpu,host=a usage=\"\",idle=false 2000");
}

TEST_F(JsonInfluxAdapterTest, Rfc3339TimeUsesPrecision) {
    config.time_multiplier = 1000000000LL;
    JsonInfluxAdapter adapter(context, config);
    adapter.process_header();

    JsonValue series = parse_json(
        R"({"name": "m", "columns": ["time", "v"], "values": [["2010-07-01T18:48:00Z", 1]]})");
    adapter.process(series);

    auto lines = context.take_line_batch();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "m v=1 1278010080");
}

TEST_F(JsonInfluxAdapterTest, UnparseableTimeIsOmitted) {
    JsonInfluxAdapter adapter(context, config);
    adapter.process_header();

    adapter.process(parse_json(R"({"name": "m", "columns": ["time", "v"], "values": [["later", 1]]})"));

    auto lines = context.take_line_batch();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "m v=1");
}

TEST_F(JsonInfluxAdapterTest, RowsWithoutFieldsAreSkipped) {
    JsonInfluxAdapter adapter(context, config);
    adapter.process_header();

    Action action = adapter.process(parse_json(R"({"name": "m", "columns": ["time"], "values": [[1], [2]]})"));

    EXPECT_TRUE(action.is_none());
    EXPECT_EQ(context.pending_lines(), 0u);
}

TEST_F(JsonInfluxAdapterTest, MissingDatabaseIsConfigurationError) {
    config.database.clear();
    JsonInfluxAdapter adapter(context, config);
    EXPECT_TRUE(adapter.process_header().is_none());

    EXPECT_THROW(adapter.process(parse_json(R"({"name": "m", "columns": ["v"], "values": [[1]]})")),
                 ConfigurationError);
    EXPECT_EQ(context.pending_lines(), 0u);
}

TEST_F(JsonInfluxAdapterTest, MalformedSeriesIsParseError) {
    JsonInfluxAdapter adapter(context, config);
    adapter.process_header();

    EXPECT_THROW(adapter.process(parse_json("[1, 2]")), ParseError);
    EXPECT_THROW(adapter.process(parse_json(R"({"name": "m", "columns": "v"})")), ParseError);
}

TEST_F(JsonInfluxAdapterTest, LargeSeriesRequestsFlush) {
    ImportContext small{2};
    JsonInfluxAdapter adapter(small, config);
    adapter.process_header();

    Action action = adapter.process(
        parse_json(R"({"name": "m", "columns": ["time", "v"], "values": [[1, 1], [2, 2], [3, 3]]})"));

    EXPECT_EQ(action.kind, Action::Kind::FLUSH);
    EXPECT_EQ(small.pending_lines(), 3u);
}

// JSON-Prom
class JsonPromAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.format = "jsonp";
        config.database = "metrics";
        config.measurement = "prom";
    }

    config::ImportConfig config;
    ImportContext context{100};
};

TEST_F(JsonPromAdapterTest, MatrixSamplesBecomeLines) {
    JsonValue document = parse_json(PROM_MATRIX_DOCUMENT);
    JsonPromAdapter adapter(context, config);

    Action header = adapter.process_header();
    EXPECT_EQ(header.command, "CREATE DATABASE metrics");

    auto arrays = JsonDocument::find_arrays(document, JsonPromAdapter::ARRAY_KEY);
    ASSERT_EQ(arrays.size(), 1u);
    adapter.process((*arrays[0])[0]);

    auto lines = context.take_line_batch();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "prom,__name__=up,job=node value=1 1435781430000000000");
    EXPECT_EQ(lines[1], "prom,__name__=up,job=node value=0 1435781445000000000");
}

TEST_F(JsonPromAdapterTest, VectorSampleWithConfiguredTagsAndField) {
    config.tags = {"job"};
    config.fields = {"up"};
    config.time_multiplier = 1000000LL;
    JsonPromAdapter adapter(context, config);
    adapter.process_header();

    adapter.process(parse_json(
        R"({"metric": {"__name__": "up", "job": "node"}, "value": [1435781451.781, "1"]})"));

    auto lines = context.take_line_batch();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "prom,job=node up=1 1435781451781");
}

TEST_F(JsonPromAdapterTest, MissingMeasurementIsConfigurationError) {
    config.measurement.clear();
    JsonPromAdapter adapter(context, config);
    adapter.process_header();

    EXPECT_THROW(adapter.process(parse_json(R"({"metric": {}, "value": [1, "1"]})")), ConfigurationError);
}

TEST_F(JsonPromAdapterTest, SampleWithoutValuesIsParseError) {
    JsonPromAdapter adapter(context, config);
    adapter.process_header();

    EXPECT_THROW(adapter.process(parse_json(R"({"metric": {}})")), ParseError);
    EXPECT_THROW(adapter.process(parse_json(R"({"metric": {}, "value": [1]})")), ParseError);
}

TEST_F(JsonPromAdapterTest, OutOfRangeSampleTimestampIsParseError) {
    JsonPromAdapter adapter(context, config);
    adapter.process_header();

    EXPECT_THROW(adapter.process(parse_json(R"({"metric": {}, "value": [1e300, "1"]})")), ParseError);
    EXPECT_THROW(adapter.process(parse_json(R"({"metric": {}, "value": ["nan", "1"]})")), ParseError);
    EXPECT_EQ(context.pending_lines(), 0u);
}
