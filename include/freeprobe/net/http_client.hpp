/**
 * @file http_client.hpp
 * @brief Blocking HTTP client used for the device API and the push gateway.
 *
 * HttpClient is the seam the core components talk to; CurlHttpClient is
 * the libcurl implementation. Every request carries an explicit timeout
 * so no call can block indefinitely.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#include "freeprobe/net/export.hpp"

#include <string>
#include <utility>
#include <vector>

namespace freeprobe {
namespace net {

/// Default per-call timeout.
constexpr int DEFAULT_HTTP_TIMEOUT_MS = 10000;

/**
 * @struct HttpRequest
 * @brief A single HTTP exchange to perform.
 */
struct FREEPROBE_NET_API HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    int timeout_ms = DEFAULT_HTTP_TIMEOUT_MS;

    /// Static name resolution entries, "host:port:address" (curl syntax).
    std::vector<std::string> resolve;
};

/**
 * @struct HttpResult
 * @brief Outcome of a request.
 *
 * ok is true only for a completed exchange with a 2xx status. A non-2xx
 * reply still carries its status_code and body; status_code is 0 when
 * the exchange did not complete (DNS, TLS, timeout...).
 */
struct FREEPROBE_NET_API HttpResult {
    bool ok = false;
    long status_code = 0;
    std::string body;
    std::string error;
};

/**
 * @class HttpClient
 * @brief Abstract synchronous HTTP client.
 */
class FREEPROBE_NET_API HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * @brief Perform a request and block until it completes or times out.
     */
    virtual HttpResult perform(const HttpRequest& request) = 0;

    HttpResult put(const std::string& url,
                   const std::string& payload,
                   const std::string& contentType,
                   int timeoutMs = DEFAULT_HTTP_TIMEOUT_MS);
};

/**
 * @struct CurlOptions
 * @brief TLS and identification settings for CurlHttpClient.
 */
struct FREEPROBE_NET_API CurlOptions {
    std::string ca_file;          ///< PEM bundle for the device certificate (empty = system store)
    bool verify_peer = true;
    std::string user_agent = "freeprobe/0.1";
};

/**
 * @class CurlHttpClient
 * @brief libcurl easy-interface implementation of HttpClient.
 *
 * Not thread-safe: one easy handle is reused across calls.
 */
class FREEPROBE_NET_API CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(CurlOptions options = CurlOptions());
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResult perform(const HttpRequest& request) override;

private:
    CurlOptions options_;
    void* handle_;  ///< CURL*, kept opaque to keep curl.h out of the header
};

}  // namespace net
}  // namespace freeprobe
