/**
 * @file http_client.cpp
 * @brief HttpClient helpers and the libcurl implementation.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#include "freeprobe/net/http_client.hpp"
#include "freeprobe/utils/logger.hpp"

#include <curl/curl.h>

#include <mutex>

namespace freeprobe {
namespace net {

namespace {

// curl_global_init is not thread-safe; run it once per process.
void ensureCurlInitialized() {
    static std::once_flag once;
    std::call_once(once, []() {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            LOG_ERROR("Http", "curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

size_t writeBody(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

}  // namespace

// =============================================================================
// HttpClient
// =============================================================================

HttpResult HttpClient::put(const std::string& url,
                           const std::string& payload,
                           const std::string& contentType,
                           int timeoutMs) {
    HttpRequest request;
    request.method = "PUT";
    request.url = url;
    request.headers.emplace_back("Content-Type", contentType);
    request.body = payload;
    request.timeout_ms = timeoutMs;
    return perform(request);
}

// =============================================================================
// CurlHttpClient
// =============================================================================

CurlHttpClient::CurlHttpClient(CurlOptions options)
    : options_(std::move(options))
    , handle_(nullptr)
{
    ensureCurlInitialized();
    handle_ = curl_easy_init();
    if (!handle_) {
        LOG_ERROR("Http", "curl_easy_init failed");
    }
}

CurlHttpClient::~CurlHttpClient() {
    if (handle_) {
        curl_easy_cleanup(static_cast<CURL*>(handle_));
    }
}

HttpResult CurlHttpClient::perform(const HttpRequest& request) {
    HttpResult result;

    CURL* curl = static_cast<CURL*>(handle_);
    if (!curl) {
        result.error = "HTTP client unavailable";
        return result;
    }

    curl_easy_reset(curl);

    struct curl_slist* headerList = nullptr;
    for (const auto& header : request.headers) {
        std::string line = header.first + ": " + header.second;
        headerList = curl_slist_append(headerList, line.c_str());
    }
    headerList = curl_slist_append(headerList, "Accept: application/json, text/plain");

    struct curl_slist* resolveList = nullptr;
    for (const auto& entry : request.resolve) {
        resolveList = curl_slist_append(resolveList, entry.c_str());
    }

    const long timeoutMs = request.timeout_ms > 0 ? request.timeout_ms : DEFAULT_HTTP_TIMEOUT_MS;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &result.body);
    if (resolveList) {
        curl_easy_setopt(curl, CURLOPT_RESOLVE, resolveList);
    }

    if (!options_.ca_file.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, options_.ca_file.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options_.verify_peer ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options_.verify_peer ? 2L : 0L);

    if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    LOG_TRACE("Http", "{} {}", request.method, request.url);

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        result.error = curl_easy_strerror(rc);
        if (rc == CURLE_OPERATION_TIMEDOUT) {
            result.error = "Request timed out";
        }
    } else {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status_code);
        if (result.status_code >= 200 && result.status_code < 300) {
            result.ok = true;
        } else {
            result.error = "HTTP " + std::to_string(result.status_code);
        }
    }

    curl_slist_free_all(headerList);
    curl_slist_free_all(resolveList);

    LOG_TRACE("Http", "{} {} -> {} ({} bytes)", request.method, request.url,
              result.status_code, result.body.size());
    return result;
}

}  // namespace net
}  // namespace freeprobe
