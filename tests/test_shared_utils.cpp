#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "utils/logger.hpp"
#include "utils/crypto_utils.hpp"
#include "utils/request_context.hpp"
#include "config/config_manager.hpp"
#include "types/common_types.hpp"
#include "core/exceptions.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace tsimport;
using namespace tsimport::utils;
using namespace tsimport::config;
using namespace tsimport::types;

// Test fixtures
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::filesystem::create_directories("test_logs");
    }

    void TearDown() override {
        Logger::shutdown();
        std::filesystem::remove_all("test_logs");
    }
};

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_config_file = "test_config.json";
        config_manager = std::make_unique<ConfigManager>();
    }

    void TearDown() override {
        std::filesystem::remove(test_config_file);
        unsetenv("TSIMPORT_HOST");
        unsetenv("TSIMPORT_DATABASE");
    }

    void write_config(const std::string& content) {
        std::ofstream file(test_config_file);
        file << content;
    }

    std::string test_config_file;
    std::unique_ptr<ConfigManager> config_manager;
};

// Logger Tests
TEST_F(LoggerTest, InitializationAndBasicLogging) {
    EXPECT_NO_THROW(Logger::initialize("test_logs/test.log", LogLevel::DEBUG));

    EXPECT_NO_THROW(Logger::info("Test info message"));
    EXPECT_NO_THROW(Logger::debug("Test debug message {}", 1));
    EXPECT_NO_THROW(Logger::warn("Test warning message"));
    EXPECT_NO_THROW(Logger::error("Test error message: {}", "reason"));

    EXPECT_EQ(Logger::get_level(), LogLevel::DEBUG);
    EXPECT_TRUE(Logger::is_enabled(LogLevel::INFO));
    EXPECT_TRUE(Logger::is_enabled(LogLevel::DEBUG));
    EXPECT_TRUE(std::filesystem::exists("test_logs/test.log"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    Logger::initialize("test_logs/level_test.log", LogLevel::WARN);

    EXPECT_EQ(Logger::get_level(), LogLevel::WARN);
    EXPECT_FALSE(Logger::is_enabled(LogLevel::DEBUG));
    EXPECT_FALSE(Logger::is_enabled(LogLevel::INFO));
    EXPECT_TRUE(Logger::is_enabled(LogLevel::WARN));
    EXPECT_TRUE(Logger::is_enabled(LogLevel::ERROR));
}

TEST_F(LoggerTest, LevelNames) {
    EXPECT_EQ(log_level_from_string("debug"), LogLevel::DEBUG);
    EXPECT_EQ(log_level_from_string("WARNING"), LogLevel::WARN);
    EXPECT_EQ(log_level_from_string("error"), LogLevel::ERROR);
    EXPECT_EQ(log_level_from_string("nonsense"), LogLevel::INFO);
}

TEST_F(LoggerTest, ImportLoggerFunctions) {
    Logger::initialize("test_logs/import_test.log", LogLevel::INFO);

    EXPECT_NO_THROW(ImportLogger::log_file_started("data.txt", "line_protocol", false, 100));
    EXPECT_NO_THROW(ImportLogger::log_ddl_executed("CREATE DATABASE db"));
    EXPECT_NO_THROW(ImportLogger::log_ddl_failed("CREATE DATABASE db", "timeout"));
    EXPECT_NO_THROW(ImportLogger::log_batch_flushed("db", "autogen", 100, "row"));
    EXPECT_NO_THROW(ImportLogger::log_batch_failed("db", "autogen", 100, "code 2"));
    EXPECT_NO_THROW(ImportLogger::log_unit_failed("DML", 7, "no fields input"));
    EXPECT_NO_THROW(ImportLogger::log_import_finished("data.txt", 10, 8, 1, 1));
}

TEST_F(LoggerTest, LoggingBeforeInitializationIsNoop) {
    EXPECT_NO_THROW(Logger::info("dropped {}", 42));
}

TEST_F(LoggerTest, ScopedTimer) {
    Logger::initialize("test_logs/timer_test.log", LogLevel::DEBUG);

    {
        ScopedTimer timer("test_operation");
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    SUCCEED();
}

// Crypto Utils Tests
TEST(CryptoUtilsTest, Base64_Encoding) {
    std::vector<uint8_t> data = {0x48, 0x65, 0x6C, 0x6C, 0x6F}; // "Hello"

    EXPECT_EQ(CryptoUtils::base64_encode(data), "SGVsbG8=");
    EXPECT_EQ(CryptoUtils::base64_encode({}), "");
}

TEST(CryptoUtilsTest, BasicAuthToken) {
    EXPECT_EQ(CryptoUtils::basic_auth_token("user", "pass"), "dXNlcjpwYXNz");
    EXPECT_EQ(CryptoUtils::basic_auth_token("", ""), "");
    EXPECT_EQ(CryptoUtils::basic_auth_token("admin", ""), "YWRtaW46");
}

// Config Manager Tests
TEST_F(ConfigManagerTest, DefaultConfiguration) {
    const auto& connection = config_manager->get_connection_config();
    EXPECT_EQ(connection.host, "localhost");
    EXPECT_EQ(connection.port, 8086);
    EXPECT_EQ(connection.column_write_port, 8305);

    const auto& import = config_manager->get_import_config();
    EXPECT_EQ(import.format, "line_protocol");
    EXPECT_EQ(import.precision, "ns");
    EXPECT_EQ(import.batch_size, 100);
    EXPECT_EQ(import.time_field, "time");
    EXPECT_FALSE(import.column_write);
}

TEST_F(ConfigManagerTest, LoadsFileAndKeepsDefaultsForMissingKeys) {
    write_config(R"({
        "connection": {"host": "tsdb.local", "username": "admin"},
        "import": {"path": "data.csv", "format": "csv", "database": "db",
                   "tags": ["city"], "fields": ["temp"], "precision": "ms", "batch_size": 500},
        "logging": {"level": "debug"}
    })");

    config_manager->load_config(test_config_file);
    config_manager->validate_config();

    const auto& connection = config_manager->get_connection_config();
    EXPECT_EQ(connection.host, "tsdb.local");
    EXPECT_EQ(connection.port, 8086);
    EXPECT_EQ(connection.username, "admin");

    const auto& import = config_manager->get_import_config();
    EXPECT_EQ(import.format, "csv");
    EXPECT_EQ(import.tags, (std::vector<std::string>{"city"}));
    EXPECT_EQ(import.batch_size, 500);
    EXPECT_EQ(import.time_multiplier, 1000000LL);
    EXPECT_EQ(config_manager->get_logging_config().level, "debug");
}

TEST_F(ConfigManagerTest, MissingOrMalformedFileIsConfigurationError) {
    EXPECT_THROW(config_manager->load_config("does_not_exist.json"), ConfigurationError);

    write_config("{ not json");
    EXPECT_THROW(config_manager->load_config(test_config_file), ConfigurationError);

    EXPECT_THROW(config_manager->load_from_string(R"({"import": {"batch_size": "many"}})"),
                 ConfigurationError);
}

TEST_F(ConfigManagerTest, EnvironmentOverrides) {
    setenv("TSIMPORT_HOST", "env-host", 1);
    setenv("TSIMPORT_DATABASE", "env_db", 1);

    config_manager->load_from_string(R"({"connection": {"host": "file-host"}, "import": {"database": "file_db"}})");
    config_manager->load_env_overrides();

    EXPECT_EQ(config_manager->get_connection_config().host, "env-host");
    EXPECT_EQ(config_manager->get_import_config().database, "env_db");
    EXPECT_EQ(config_manager->get_env_var("TSIMPORT_UNSET_VARIABLE", "fallback"), "fallback");
}

TEST_F(ConfigManagerTest, ConfigurationValidation) {
    ImportConfig config;
    config.format = "";
    config.batch_size = 0;
    config.time_field = "";
    config.precision = "s";

    ConfigManager::validate_import_config(config);
    EXPECT_EQ(config.format, "line_protocol");
    EXPECT_EQ(config.batch_size, 100);
    EXPECT_EQ(config.time_field, "time");
    EXPECT_EQ(config.time_multiplier, 1000000000LL);

    config.precision = "minutes";
    EXPECT_THROW(ConfigManager::validate_import_config(config), ConfigurationError);

    config.precision = "ns";
    config.format = "xml";
    try {
        ConfigManager::validate_import_config(config);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(std::string(e.what()), "unknown format xml, only support line_protocol, csv, jsoni, jsonp");
    }
}

// Request context Tests
TEST(RequestContextTest, BackgroundNeverExpires) {
    RequestContext ctx = RequestContext::background();
    EXPECT_FALSE(ctx.done());
    EXPECT_FALSE(ctx.deadline().has_value());
    EXPECT_EQ(ctx.remaining(std::chrono::milliseconds(250)).count(), 250);
}

TEST(RequestContextTest, CopiesShareCancellation) {
    RequestContext ctx;
    RequestContext copy = ctx;

    copy.cancel();
    EXPECT_TRUE(ctx.is_cancelled());
    EXPECT_TRUE(ctx.done());
}

TEST(RequestContextTest, DeadlineExpires) {
    RequestContext ctx = RequestContext::with_timeout(std::chrono::milliseconds(0));
    EXPECT_TRUE(ctx.expired());
    EXPECT_TRUE(ctx.done());
    EXPECT_EQ(ctx.remaining(std::chrono::milliseconds(1000)).count(), 0);
}

TEST(RequestContextTest, ChildKeepsEarlierDeadline) {
    RequestContext parent = RequestContext::with_timeout(std::chrono::hours(1));
    RequestContext child = parent.with_deadline(RequestContext::Clock::now() + std::chrono::hours(2));

    EXPECT_EQ(child.deadline(), parent.deadline());
    child.cancel();
    EXPECT_TRUE(parent.is_cancelled());
}

// Common types Tests
TEST(CommonTypesTest, PointSerialisation) {
    Point point("cpu load");
    point.add_tag("host", "a b").add_field("v", 1.5).add_field("n", int64_t(2)).set_timestamp(7);

    EXPECT_EQ(point.to_line_protocol(), "cpu\\ load,host=a\\ b n=2i,v=1.5 7");
}

TEST(CommonTypesTest, FormatNames) {
    EXPECT_EQ(format_from_string("jsoni"), ImportFormat::JSON_INFLUX);
    EXPECT_EQ(format_from_string(""), ImportFormat::LINE_PROTOCOL);
    EXPECT_FALSE(format_from_string("parquet").has_value());
    EXPECT_EQ(format_to_string(ImportFormat::JSON_PROM), "jsonp");
}

TEST(CommonTypesTest, FloatFormattingHasNoExponent) {
    EXPECT_EQ(line_protocol::format_float(66.6), "66.6");
    EXPECT_EQ(line_protocol::format_float(1e21), "1000000000000000000000");
    EXPECT_EQ(line_protocol::format_float(3.0), "3");
}

// Main test runner
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
