#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "types/common_types.hpp"

namespace tsimport {
namespace config {

constexpr const char* DEFAULT_HOST = "localhost";
constexpr const char* DEFAULT_RETENTION_POLICY = "autogen";
constexpr const char* DEFAULT_FORMAT = "line_protocol";
constexpr const char* DEFAULT_TIME_FIELD = "time";
constexpr int DEFAULT_HTTP_PORT = 8086;
constexpr int DEFAULT_COLUMN_WRITE_PORT = 8305;
constexpr int DEFAULT_REQUEST_TIMEOUT_MS = 5000;
constexpr int DEFAULT_BATCH_SIZE = 100;

struct ConnectionConfig {
    std::string host = DEFAULT_HOST;
    int port = DEFAULT_HTTP_PORT;
    int column_write_port = DEFAULT_COLUMN_WRITE_PORT;
    std::string username;
    std::string password;
    int timeout_ms = DEFAULT_REQUEST_TIMEOUT_MS;

    // TLS material is handed to the clients untouched
    bool enable_tls = false;
    bool insecure_tls = false;
    std::string ca_cert;
    std::string cert;
    std::string cert_key;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ConnectionConfig, host, port, column_write_port,
                                                username, password, timeout_ms, enable_tls,
                                                insecure_tls, ca_cert, cert, cert_key)

struct ImportConfig {
    std::string path;
    std::string format = DEFAULT_FORMAT;
    std::string database;
    std::string retention_policy;
    std::string measurement;
    std::vector<std::string> tags;
    std::vector<std::string> fields;
    std::string time_field = DEFAULT_TIME_FIELD;
    std::string precision = "ns";
    int batch_size = DEFAULT_BATCH_SIZE;
    bool column_write = false;

    // Derived from precision by ConfigManager::validate_import_config
    int64_t time_multiplier = 1;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ImportConfig, path, format, database,
                                                retention_policy, measurement, tags, fields,
                                                time_field, precision, batch_size, column_write)

struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/tsimport.log";
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 3;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(LoggingConfig, level, file, max_file_size, max_files)

// Multiplier turning a timestamp in the given precision into nanoseconds.
// Throws ConfigurationError for anything but s, ms, us, ns or empty.
int64_t time_multiplier_for(const std::string& precision);

class ConfigManager {
public:
    ConfigManager() = default;

    // Configuration loading; throws ConfigurationError on unreadable or invalid files
    void load_config(const std::string& config_file_path);
    void load_from_string(const std::string& content);

    // Environment variable support
    std::string get_env_var(const std::string& var_name, const std::string& default_value = "") const;
    void load_env_overrides();

    // Normalises defaults and derives the time multiplier
    static void validate_import_config(ImportConfig& config);
    void validate_config();

    ConnectionConfig& get_connection_config() { return connection_config_; }
    ImportConfig& get_import_config() { return import_config_; }
    LoggingConfig& get_logging_config() { return logging_config_; }

    const ConnectionConfig& get_connection_config() const { return connection_config_; }
    const ImportConfig& get_import_config() const { return import_config_; }
    const LoggingConfig& get_logging_config() const { return logging_config_; }

private:
    void apply_json(const nlohmann::json& config_data);

    ConnectionConfig connection_config_;
    ImportConfig import_config_;
    LoggingConfig logging_config_;
};

} // namespace config
} // namespace tsimport
