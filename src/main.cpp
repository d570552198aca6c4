#include <iostream>
#include <csignal>
#include <memory>
#include <string>

#include "utils/logger.hpp"
#include "utils/request_context.hpp"
#include "config/config_manager.hpp"
#include "http_client.hpp"
#include "column_write_client.hpp"
#include "import_command.hpp"

using namespace tsimport;

class ImportApplication {
private:
    config::ConfigManager config_manager_;
    utils::RequestContext ctx_;
    std::unique_ptr<importer::CurlGlobalGuard> curl_guard_;

public:
    void initialize(const std::string& config_path, const std::string& input_override) {
        config_manager_.load_config(config_path);
        config_manager_.load_env_overrides();
        if (!input_override.empty()) {
            config_manager_.get_import_config().path = input_override;
        }
        config_manager_.validate_config();

        const auto& logging = config_manager_.get_logging_config();
        utils::Logger::initialize(logging.file, utils::log_level_from_string(logging.level),
                                  logging.max_file_size, logging.max_files);

        curl_guard_ = std::make_unique<importer::CurlGlobalGuard>();
        utils::Logger::info("=== tsimport starting, config: {} ===", config_path);
    }

    int run() {
        const auto& connection = config_manager_.get_connection_config();
        const auto& import = config_manager_.get_import_config();

        importer::HttpClient http_client(connection);
        if (!http_client.ping(ctx_)) {
            utils::Logger::warn("Store at {} did not answer ping, continuing", http_client.base_url());
        }

        std::unique_ptr<importer::GrpcColumnWriteClient> column_client;
        if (import.column_write || import.format == "csv") {
            column_client = std::make_unique<importer::GrpcColumnWriteClient>(connection);
        }

        importer::ImportCommand command(import, http_client, http_client, column_client.get(),
                                        connection.username, connection.password);
        importer::ImportStats stats = command.run(ctx_);

        utils::Logger::info("Read {} units: {} written, {} skipped, {} failed, {} dropped, {} queries",
                            stats.units_read, stats.units_written, stats.units_skipped,
                            stats.units_failed, stats.units_dropped, stats.queries_executed);
        return stats.cancelled ? 1 : 0;
    }

    void cancel() {
        ctx_.cancel();
    }

    void shutdown() {
        utils::Logger::info("=== tsimport shutdown complete ===");
        curl_guard_.reset();
        utils::Logger::shutdown();
    }
};

// Global application instance
std::unique_ptr<ImportApplication> g_application;

// Signal handler for graceful cancellation
void signal_handler(int) {
    if (g_application) {
        g_application->cancel();
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <config.json> [input-file]" << std::endl;
        return 1;
    }

    try {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        g_application = std::make_unique<ImportApplication>();
        g_application->initialize(argv[1], argc > 2 ? argv[2] : "");

        int exit_code = g_application->run();
        g_application->shutdown();
        return exit_code;

    } catch (const std::exception& e) {
        utils::Logger::error("Fatal error in main: {}", e.what());
        std::cerr << "FATAL: " << e.what() << std::endl;
        if (g_application) {
            g_application->shutdown();
        }
        return 1;
    }
}
