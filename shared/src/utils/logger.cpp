#include "utils/logger.hpp"
#include <filesystem>
#include <iostream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <vector>

namespace tsimport {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
LogLevel Logger::current_level_ = LogLevel::INFO;

LogLevel log_level_from_string(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

void Logger::initialize(const std::string& log_file_path, LogLevel level,
                       size_t max_file_size, size_t max_files) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Create console sink
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog_level(level));
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        sinks.push_back(console_sink);

        // Create rotating file sink
        if (!log_file_path.empty()) {
            std::filesystem::path log_path(log_file_path);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file_path, max_file_size, max_files);
            file_sink->set_level(to_spdlog_level(level));
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        // Create multi-sink logger
        logger_ = std::make_shared<spdlog::logger>("tsimport", sinks.begin(), sinks.end());

        // Set log level
        logger_->set_level(to_spdlog_level(level));
        current_level_ = level;

        // Register as default logger
        spdlog::drop("tsimport");
        spdlog::register_logger(logger_);
        spdlog::set_default_logger(logger_);

        // Set flush policy
        logger_->flush_on(spdlog::level::warn);

        Logger::debug("Logger initialized, file sink: {}", log_file_path);

    } catch (const std::exception& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        throw;
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::shutdown();
        logger_ = nullptr;
    }
}

void Logger::set_level(LogLevel level) {
    current_level_ = level;
    if (logger_) {
        logger_->set_level(to_spdlog_level(level));
    }
}

LogLevel Logger::get_level() {
    return current_level_;
}

bool Logger::is_enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(current_level_);
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        default: return spdlog::level::info;
    }
}

// ImportLogger implementation
void ImportLogger::log_file_started(const std::string& path, const std::string& format,
                                    bool column_write, size_t batch_size) {
    Logger::info("IMPORT_STARTED | Path: {} | Format: {} | Transport: {} | BatchSize: {}",
                 path, format, column_write ? "column" : "row", batch_size);
}

void ImportLogger::log_ddl_executed(const std::string& command) {
    Logger::info("DDL_EXECUTED | Command: {}", command);
}

void ImportLogger::log_ddl_failed(const std::string& command, const std::string& reason) {
    Logger::error("DDL_FAILED | Command: {} | Reason: {}", command, reason);
}

void ImportLogger::log_batch_flushed(const std::string& database, const std::string& retention_policy,
                                     size_t units, const std::string& transport) {
    Logger::debug("BATCH_FLUSHED | Target: {}.{} | Units: {} | Transport: {}",
                  database, retention_policy, units, transport);
}

void ImportLogger::log_batch_failed(const std::string& database, const std::string& retention_policy,
                                    size_t units, const std::string& reason) {
    Logger::error("BATCH_FAILED | Target: {}.{} | Units dropped: {} | Reason: {}",
                  database, retention_policy, units, reason);
}

void ImportLogger::log_unit_failed(const std::string& stage, size_t unit_number,
                                   const std::string& reason) {
    Logger::error("UNIT_FAILED | Stage: {} | Unit: {} | Reason: {}", stage, unit_number, reason);
}

void ImportLogger::log_import_finished(const std::string& path, size_t units_read,
                                       size_t units_written, size_t units_failed,
                                       size_t units_dropped) {
    std::stringstream ss;
    ss << "IMPORT_FINISHED | Path: " << path << " | Read: " << units_read
       << " | Written: " << units_written << " | Failed: " << units_failed
       << " | Dropped: " << units_dropped;
    Logger::info("{}", ss.str());
}

// ScopedTimer implementation
ScopedTimer::ScopedTimer(const std::string& operation_name)
    : operation_name_(operation_name), start_time_(std::chrono::high_resolution_clock::now()) {
}

ScopedTimer::~ScopedTimer() {
    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time_);
    Logger::debug("TIMER | Operation: {} | Duration: {} ms", operation_name_, duration.count());
}

} // namespace utils
} // namespace tsimport
