#include "http_client.hpp"
#include "core/exceptions.hpp"
#include "network/network_exception.hpp"
#include "utils/crypto_utils.hpp"
#include "utils/logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>

namespace tsimport {
namespace importer {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

CurlGlobalGuard::CurlGlobalGuard() {
    CURLcode result = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (result != CURLE_OK) {
        throw ConnectionException(std::string("curl_global_init failed: ") + curl_easy_strerror(result));
    }
}

CurlGlobalGuard::~CurlGlobalGuard() {
    curl_global_cleanup();
}

HttpClient::HttpClient(const config::ConnectionConfig& config)
    : config_(config) {
    base_url_ = (config_.enable_tls ? "https://" : "http://") + config_.host + ":" +
                std::to_string(config_.port);
    std::string token = utils::CryptoUtils::basic_auth_token(config_.username, config_.password);
    if (!token.empty()) {
        auth_header_ = "Basic " + token;
    }
}

size_t HttpClient::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

int HttpClient::progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* ctx = static_cast<const utils::RequestContext*>(clientp);
    return ctx->is_cancelled() ? 1 : 0;
}

std::string HttpClient::url_encode(const std::string& str) {
    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) {
        throw ConnectionException("Failed to initialize CURL handle");
    }
    char* escaped = curl_easy_escape(curl.get(), str.c_str(), static_cast<int>(str.length()));
    if (!escaped) {
        throw ConnectionException("Failed to URL-encode value");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

std::string HttpClient::build_url(const std::string& endpoint,
                                  const std::map<std::string, std::string>& params) const {
    std::string url = base_url_;
    if (!endpoint.empty()) {
        if (endpoint[0] != '/') {
            url += "/";
        }
        url += endpoint;
    }

    if (!params.empty()) {
        url += "?";
        bool first = true;
        for (const auto& pair : params) {
            if (!first) {
                url += "&";
            }
            url += url_encode(pair.first) + "=" + url_encode(pair.second);
            first = false;
        }
    }
    return url;
}

std::string HttpClient::extract_error(const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return "";
    }
    if (json.contains("error") && json["error"].is_string()) {
        return json["error"].get<std::string>();
    }
    if (json.contains("results") && json["results"].is_array()) {
        for (const auto& result : json["results"]) {
            if (result.is_object() && result.contains("error") && result["error"].is_string()) {
                return result["error"].get<std::string>();
            }
        }
    }
    return "";
}

HttpResponse HttpClient::request(const utils::RequestContext& ctx, const HttpRequest& request) {
    if (ctx.is_cancelled()) {
        throw CancelledException("request cancelled before start: " + request.url);
    }
    if (ctx.expired()) {
        throw TimeoutException("deadline exceeded before start: " + request.url);
    }

    auto start_time = std::chrono::steady_clock::now();
    total_requests_.fetch_add(1);

    HttpResponse response;

    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) {
        failed_requests_.fetch_add(1);
        throw ConnectionException("Failed to initialize CURL handle");
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());

    if (request.method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.length()));
    }

    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, HttpClient::write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    // Cancellation is polled through the transfer progress callback
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, HttpClient::progress_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

    long timeout_ms = ctx.remaining(std::chrono::milliseconds(request.timeout_ms)).count();
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms > 0 ? timeout_ms : 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.timeout_ms));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "tsimport/1.0");

    if (config_.enable_tls) {
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, config_.insecure_tls ? 0L : 1L);
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, config_.insecure_tls ? 0L : 2L);
        if (!config_.ca_cert.empty()) {
            curl_easy_setopt(curl.get(), CURLOPT_CAINFO, config_.ca_cert.c_str());
        }
        if (!config_.cert.empty()) {
            curl_easy_setopt(curl.get(), CURLOPT_SSLCERT, config_.cert.c_str());
        }
        if (!config_.cert_key.empty()) {
            curl_easy_setopt(curl.get(), CURLOPT_SSLKEY, config_.cert_key.c_str());
        }
    }

    curl_slist* raw_list = nullptr;
    for (const auto& header : request.headers) {
        std::string header_str = header.first + ": " + header.second;
        raw_list = curl_slist_append(raw_list, header_str.c_str());
    }
    if (!auth_header_.empty()) {
        raw_list = curl_slist_append(raw_list, ("Authorization: " + auth_header_).c_str());
    }
    std::unique_ptr<curl_slist, CurlSlistDeleter> header_list(raw_list);
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }

    CURLcode result = curl_easy_perform(curl.get());

    long response_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code);
    response.status_code = response_code;

    auto end_time = std::chrono::steady_clock::now();
    response.response_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();

    if (result != CURLE_OK) {
        failed_requests_.fetch_add(1);
        std::string error_message = curl_easy_strerror(result);
        TSIMPORT_LOG_DEBUG("CURL request failed: {} ({})", error_message, static_cast<int>(result));
        if (result == CURLE_ABORTED_BY_CALLBACK) {
            throw CancelledException("Request cancelled: " + request.url);
        }
        if (result == CURLE_OPERATION_TIMEDOUT) {
            throw TimeoutException("Request timed out: " + error_message);
        }
        throw ConnectionException("Request failed: " + error_message);
    }

    if (response_code >= 400) {
        failed_requests_.fetch_add(1);
        TSIMPORT_LOG_WARN("HTTP error {}: {}", response_code, request.url);
    }

    TSIMPORT_LOG_TRACE("HTTP {} {} -> {} ({} bytes, {} ms)", request.method, request.url,
                       response_code, response.body.length(), response.response_time_ms);
    return response;
}

QueryResult HttpClient::query(const utils::RequestContext& ctx, const std::string& command) {
    HttpRequest req;
    req.method = "POST";
    req.url = build_url("/query");
    req.body = "q=" + url_encode(command);
    req.headers["Content-Type"] = "application/x-www-form-urlencoded";
    req.timeout_ms = config_.timeout_ms;

    HttpResponse response = request(ctx, req);

    std::string error = extract_error(response.body);
    if (!response.is_success() || !error.empty()) {
        throw ImportException("query failed, status: " + std::to_string(response.status_code) +
                              ", error: " + (error.empty() ? response.body : error));
    }
    return QueryResult{response.status_code, std::move(response.body)};
}

void HttpClient::write(const utils::RequestContext& ctx,
                       const std::string& database,
                       const std::string& retention_policy,
                       const std::string& body,
                       const std::string& precision) {
    std::map<std::string, std::string> params{{"db", database}};
    if (!retention_policy.empty()) {
        params["rp"] = retention_policy;
    }
    if (!precision.empty()) {
        params["precision"] = precision;
    }

    HttpRequest req;
    req.method = "POST";
    req.url = build_url("/write", params);
    req.body = body;
    req.headers["Content-Type"] = "text/plain; charset=utf-8";
    req.timeout_ms = config_.timeout_ms;

    HttpResponse response = request(ctx, req);
    if (!response.is_success()) {
        std::string error = extract_error(response.body);
        throw WriteError("write failed, status: " + std::to_string(response.status_code) +
                         ", error: " + (error.empty() ? response.body : error));
    }
}

bool HttpClient::ping(const utils::RequestContext& ctx) {
    HttpRequest req;
    req.url = build_url("/ping");
    req.timeout_ms = config_.timeout_ms;
    try {
        return request(ctx, req).is_success();
    } catch (const NetworkException& e) {
        TSIMPORT_LOG_WARN("Ping {} failed: {}", base_url_, e.what());
        return false;
    }
}

} // namespace importer
} // namespace tsimport
