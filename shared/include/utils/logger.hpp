#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <cstddef>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace tsimport {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

LogLevel log_level_from_string(const std::string& name);

class Logger {
public:
    static void initialize(const std::string& log_file_path = "logs/tsimport.log",
                          LogLevel level = LogLevel::INFO,
                          size_t max_file_size = 1024 * 1024 * 10,  // 10MB
                          size_t max_files = 3);

    static void shutdown();

    // Template logging functions
    template<typename... Args>
    static void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->critical(fmt, std::forward<Args>(args)...);
        }
    }

    // Set log level dynamically
    static void set_level(LogLevel level);

    // Get current log level
    static LogLevel get_level();

    // Check if a log level is enabled
    static bool is_enabled(LogLevel level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static spdlog::level::level_enum to_spdlog_level(LogLevel level);
    static LogLevel current_level_;
};

// Structured logging for import events
class ImportLogger {
public:
    static void log_file_started(const std::string& path, const std::string& format,
                                 bool column_write, size_t batch_size);

    static void log_ddl_executed(const std::string& command);

    static void log_ddl_failed(const std::string& command, const std::string& reason);

    static void log_batch_flushed(const std::string& database, const std::string& retention_policy,
                                  size_t units, const std::string& transport);

    static void log_batch_failed(const std::string& database, const std::string& retention_policy,
                                 size_t units, const std::string& reason);

    static void log_unit_failed(const std::string& stage, size_t unit_number,
                                const std::string& reason);

    static void log_import_finished(const std::string& path, size_t units_read,
                                    size_t units_written, size_t units_failed,
                                    size_t units_dropped);
};

// RAII logging scope for performance measurement
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& operation_name);
    ~ScopedTimer();

private:
    std::string operation_name_;
    std::chrono::high_resolution_clock::time_point start_time_;
};

// Macros for convenient logging
#define TSIMPORT_LOG_TRACE(...) tsimport::utils::Logger::trace(__VA_ARGS__)
#define TSIMPORT_LOG_DEBUG(...) tsimport::utils::Logger::debug(__VA_ARGS__)
#define TSIMPORT_LOG_INFO(...) tsimport::utils::Logger::info(__VA_ARGS__)
#define TSIMPORT_LOG_WARN(...) tsimport::utils::Logger::warn(__VA_ARGS__)
#define TSIMPORT_LOG_ERROR(...) tsimport::utils::Logger::error(__VA_ARGS__)
#define TSIMPORT_LOG_CRITICAL(...) tsimport::utils::Logger::critical(__VA_ARGS__)

#define TSIMPORT_SCOPED_TIMER(name) tsimport::utils::ScopedTimer timer(name)

} // namespace utils
} // namespace tsimport
