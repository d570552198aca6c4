#pragma once

#include "clients.hpp"
#include "config/config_manager.hpp"
#include <string>
#include <map>
#include <atomic>
#include <curl/curl.h>

namespace tsimport {
namespace importer {

struct HttpResponse {
    long status_code = 0;
    std::string body;
    long response_time_ms = 0;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
};

struct HttpRequest {
    std::string url;
    std::string method = "GET";
    std::map<std::string, std::string> headers;
    std::string body;
    long timeout_ms = config::DEFAULT_REQUEST_TIMEOUT_MS;
};

// curl_global_init/curl_global_cleanup for the lifetime of the process
class CurlGlobalGuard {
public:
    CurlGlobalGuard();
    ~CurlGlobalGuard();
    CurlGlobalGuard(const CurlGlobalGuard&) = delete;
    CurlGlobalGuard& operator=(const CurlGlobalGuard&) = delete;
};

// HTTP query and row-write endpoints of the store
class HttpClient : public QueryClient, public RowWriteClient {
public:
    explicit HttpClient(const config::ConnectionConfig& config);
    ~HttpClient() override = default;

    QueryResult query(const utils::RequestContext& ctx, const std::string& command) override;

    void write(const utils::RequestContext& ctx,
               const std::string& database,
               const std::string& retention_policy,
               const std::string& body,
               const std::string& precision) override;

    bool ping(const utils::RequestContext& ctx);

    // Throws TimeoutException, CancelledException or ConnectionException on transport errors
    HttpResponse request(const utils::RequestContext& ctx, const HttpRequest& request);

    std::string build_url(const std::string& endpoint,
                          const std::map<std::string, std::string>& params = {}) const;

    const std::string& base_url() const { return base_url_; }

    // Statistics
    long long get_total_requests() const { return total_requests_.load(); }
    long long get_failed_requests() const { return failed_requests_.load(); }

private:
    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp);
    static int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                                 curl_off_t ultotal, curl_off_t ulnow);

    static std::string url_encode(const std::string& str);
    // Error message carried in an InfluxQL-style JSON body, empty if none
    static std::string extract_error(const std::string& body);

    config::ConnectionConfig config_;
    std::string base_url_;
    std::string auth_header_;

    std::atomic<long long> total_requests_{0};
    std::atomic<long long> failed_requests_{0};
};

} // namespace importer
} // namespace tsimport
