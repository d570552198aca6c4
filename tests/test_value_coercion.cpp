#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include <limits>
#include "value_coercion.hpp"
#include "config/config_manager.hpp"
#include "core/exceptions.hpp"

using namespace tsimport;
using namespace tsimport::importer;
using namespace tsimport::types;

TEST(ValueCoercionTest, FieldValues) {
    EXPECT_EQ(field_to_string(FieldValue(int64_t(55))), "55");
    EXPECT_EQ(field_to_string(FieldValue(66.6)), "66.6");
    EXPECT_EQ(field_to_string(FieldValue(true)), "true");
    EXPECT_EQ(field_to_string(FieldValue(false)), "false");
    EXPECT_EQ(field_to_string(FieldValue(std::string("royal"))), "\"royal\"");
    EXPECT_EQ(field_to_string(std::nullopt), "\"\"");
}

TEST(ValueCoercionTest, StringFieldIsEscaped) {
    EXPECT_EQ(field_to_string(FieldValue(std::string("a\"b"))), "\"a\\\"b\"");
}

TEST(ValueCoercionTest, NumericTimestampsPassThrough) {
    EXPECT_EQ(timestamp_to_string(FieldValue(int64_t(1234567890)), 1), "1234567890");
    EXPECT_EQ(timestamp_to_string(FieldValue(1234567890.1), 1), "1234567890.1");
}

TEST(ValueCoercionTest, Rfc3339TimestampUsesPrecision) {
    FieldValue text(std::string("2010-07-01T18:48:00Z"));
    EXPECT_EQ(timestamp_to_string(text, 1000000000LL), "1278010080");
    EXPECT_EQ(timestamp_to_string(text, 1000000LL), "1278010080000");
    EXPECT_EQ(timestamp_to_string(text, 1), "1278010080000000000");
}

TEST(ValueCoercionTest, InvalidTimestampBecomesEmpty) {
    EXPECT_EQ(timestamp_to_string(FieldValue(std::string("yesterday")), 1), "");
    EXPECT_EQ(timestamp_to_string(FieldValue(true), 1), "");
    EXPECT_EQ(timestamp_to_string(std::nullopt, 1), "");
}

TEST(ValueCoercionTest, DispatchOnKind) {
    OptionalValue value = FieldValue(std::string("2010-07-01T18:48:00Z"));
    EXPECT_EQ(parse_to_string(value, CoercionKind::FIELD, 1), "\"2010-07-01T18:48:00Z\"");
    EXPECT_EQ(parse_to_string(value, CoercionKind::TIMESTAMP, 1000000000LL), "1278010080");
}

TEST(ValueCoercionTest, Rfc3339FractionAndOffset) {
    EXPECT_EQ(parse_rfc3339_nanos("2010-07-01T18:48:00.5Z"), 1278010080500000000LL);
    EXPECT_EQ(parse_rfc3339_nanos("2010-07-01T20:48:00+02:00"), 1278010080000000000LL);
    EXPECT_EQ(parse_rfc3339_nanos("2010-07-01T16:48:00-02:00"), 1278010080000000000LL);
    EXPECT_FALSE(parse_rfc3339_nanos("2010-07-01 18:48:00Z").has_value());
    EXPECT_FALSE(parse_rfc3339_nanos("2010-07-01T18:48:00").has_value());
    EXPECT_FALSE(parse_rfc3339_nanos("2010-07-01T18:48:00Zjunk").has_value());
}

TEST(ValueCoercionTest, InfersTokenTypes) {
    EXPECT_EQ(std::get<int64_t>(infer_field_value("3i", false)), 3);
    EXPECT_EQ(std::get<int64_t>(infer_field_value("-3i", false)), -3);
    EXPECT_EQ(std::get<int64_t>(infer_field_value("7u", false)), 7);
    EXPECT_TRUE(std::get<bool>(infer_field_value("t", false)));
    EXPECT_TRUE(std::get<bool>(infer_field_value("True", false)));
    EXPECT_FALSE(std::get<bool>(infer_field_value("FALSE", false)));
    EXPECT_EQ(std::get<double>(infer_field_value("1.5", false)), 1.5);
    EXPECT_EQ(std::get<double>(infer_field_value("-2", false)), -2.0);
    EXPECT_EQ(std::get<std::string>(infer_field_value("abc", false)), "abc");
    EXPECT_EQ(std::get<std::string>(infer_field_value("1", true)), "1");
}

// Timestamp precision scaling
TEST(TimestampPrecisionTest, MultiplierPerPrecision) {
    EXPECT_EQ(config::time_multiplier_for("ns"), 1);
    EXPECT_EQ(config::time_multiplier_for(""), 1);
    EXPECT_EQ(config::time_multiplier_for("us"), 1000LL);
    EXPECT_EQ(config::time_multiplier_for("ms"), 1000000LL);
    EXPECT_EQ(config::time_multiplier_for("s"), 1000000000LL);
    EXPECT_THROW(config::time_multiplier_for("h"), ConfigurationError);
}

TEST(TimestampPrecisionTest, ScalesNumericText) {
    EXPECT_EQ(parse_timestamp_best_effort("1234567890", config::time_multiplier_for("s")), 1234567890000000000LL);
    EXPECT_EQ(parse_timestamp_best_effort("1234567890", config::time_multiplier_for("ms")), 1234567890000000LL);
    EXPECT_EQ(parse_timestamp_best_effort("1234567890", config::time_multiplier_for("us")), 1234567890000LL);
    EXPECT_EQ(parse_timestamp_best_effort("1234567890", config::time_multiplier_for("ns")), 1234567890LL);
    EXPECT_EQ(parse_timestamp_best_effort("1234567890", config::time_multiplier_for("")), 1234567890LL);
}

TEST(TimestampPrecisionTest, AcceptsDecimalAndRfc3339) {
    EXPECT_EQ(parse_timestamp_best_effort("12.9", 1000), 12000);
    EXPECT_EQ(parse_timestamp_best_effort("2010-07-01T18:48:00Z", 1000000000LL), 1278010080000000000LL);
}

TEST(TimestampPrecisionTest, UnparseableDefaultsToNow) {
    EXPECT_GT(parse_timestamp_best_effort("", 1), 0);
    EXPECT_GT(parse_timestamp_best_effort("soon", 1), 0);
}

TEST(TimestampPrecisionTest, NonFiniteAndHugeDecimalsDefaultToNow) {
    int64_t before = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    EXPECT_GE(parse_timestamp_best_effort("nan", 1), before);
    EXPECT_GE(parse_timestamp_best_effort("inf", 1), before);
    EXPECT_GE(parse_timestamp_best_effort("1e30", 1), before);
    EXPECT_GE(parse_timestamp_best_effort("-1e30", 1), before);
}

TEST(TimestampPrecisionTest, ScaledOverflowDefaultsToNow) {
    int64_t before = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    EXPECT_GE(parse_timestamp_best_effort("99999999999", config::time_multiplier_for("s")), before);
    EXPECT_GE(parse_timestamp_best_effort("99999999999.5", config::time_multiplier_for("s")), before);
    EXPECT_EQ(parse_timestamp_best_effort("9223372036", config::time_multiplier_for("s")), 9223372036000000000LL);
}

TEST(TimestampPrecisionTest, ScaleAndTruncateBounds) {
    EXPECT_EQ(scale_timestamp(42, 1000), std::optional<int64_t>(42000));
    EXPECT_EQ(scale_timestamp(-42, 1000), std::optional<int64_t>(-42000));
    EXPECT_FALSE(scale_timestamp(std::numeric_limits<int64_t>::max() / 10 + 1, 10).has_value());
    EXPECT_FALSE(scale_timestamp(std::numeric_limits<int64_t>::min() / 10 - 1, 10).has_value());

    EXPECT_EQ(truncate_to_int64(12.9), std::optional<int64_t>(12));
    EXPECT_FALSE(truncate_to_int64(std::nan("")).has_value());
    EXPECT_FALSE(truncate_to_int64(1e30).has_value());
    EXPECT_FALSE(truncate_to_int64(9223372036854775808.0).has_value());
}
