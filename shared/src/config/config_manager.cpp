#include "config/config_manager.hpp"
#include "core/exceptions.hpp"
#include "utils/logger.hpp"
#include <fstream>
#include <cstdlib>

namespace tsimport {
namespace config {

int64_t time_multiplier_for(const std::string& precision) {
    if (precision.empty() || precision == "ns") return 1;
    if (precision == "us") return 1000LL;
    if (precision == "ms") return 1000LL * 1000LL;
    if (precision == "s") return 1000LL * 1000LL * 1000LL;
    throw ConfigurationError("incorrect timestamp precision, only support (s, ms, us, ns)");
}

void ConfigManager::load_config(const std::string& config_file_path) {
    std::ifstream file(config_file_path);
    if (!file.is_open()) {
        throw ConfigurationError("failed to open config file: " + config_file_path);
    }

    nlohmann::json config_data;
    try {
        file >> config_data;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("error parsing config file " + config_file_path + ": " + e.what());
    }

    apply_json(config_data);
    utils::Logger::debug("Loaded configuration from {}", config_file_path);
}

void ConfigManager::load_from_string(const std::string& content) {
    nlohmann::json config_data;
    try {
        config_data = nlohmann::json::parse(content);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("error parsing config: ") + e.what());
    }
    apply_json(config_data);
}

void ConfigManager::apply_json(const nlohmann::json& config_data) {
    try {
        if (config_data.contains("connection")) {
            config_data["connection"].get_to(connection_config_);
        }
        if (config_data.contains("import")) {
            config_data["import"].get_to(import_config_);
        }
        if (config_data.contains("logging")) {
            config_data["logging"].get_to(logging_config_);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("invalid config value: ") + e.what());
    }
}

std::string ConfigManager::get_env_var(const std::string& var_name, const std::string& default_value) const {
    const char* value = std::getenv(var_name.c_str());
    return value ? std::string(value) : default_value;
}

void ConfigManager::load_env_overrides() {
    connection_config_.host = get_env_var("TSIMPORT_HOST", connection_config_.host);
    connection_config_.username = get_env_var("TSIMPORT_USERNAME", connection_config_.username);
    connection_config_.password = get_env_var("TSIMPORT_PASSWORD", connection_config_.password);
    import_config_.database = get_env_var("TSIMPORT_DATABASE", import_config_.database);
}

void ConfigManager::validate_import_config(ImportConfig& config) {
    if (config.format.empty()) {
        config.format = DEFAULT_FORMAT;
    }
    if (!types::format_from_string(config.format)) {
        throw ConfigurationError("unknown format " + config.format +
                                 ", only support line_protocol, csv, jsoni, jsonp");
    }
    if (config.batch_size <= 0) {
        config.batch_size = DEFAULT_BATCH_SIZE;
    }
    if (config.time_field.empty()) {
        config.time_field = DEFAULT_TIME_FIELD;
    }
    config.time_multiplier = time_multiplier_for(config.precision);
}

void ConfigManager::validate_config() {
    if (connection_config_.column_write_port == 0) {
        connection_config_.column_write_port = DEFAULT_COLUMN_WRITE_PORT;
    }
    if (connection_config_.host.empty()) {
        connection_config_.host = DEFAULT_HOST;
    }
    if (connection_config_.timeout_ms <= 0) {
        connection_config_.timeout_ms = DEFAULT_REQUEST_TIMEOUT_MS;
    }
    validate_import_config(import_config_);
}

} // namespace config
} // namespace tsimport
