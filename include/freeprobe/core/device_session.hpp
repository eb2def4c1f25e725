/**
 * @file device_session.hpp
 * @brief Registration and authenticated session with the device API.
 *
 * Registration (first run, needs a button press on the device):
 * @code
 *   POST {base}/login/authorize/        -> app_token, track_id
 *   GET  {base}/login/authorize/{id}    -> pending ... granted
 * @endcode
 *
 * Session (every run):
 * @code
 *   GET  {base}/login/                  -> challenge
 *   POST {base}/login/session/          app_id, hex(HMAC-SHA1(app_token, challenge))
 *                                       -> session_token
 * @endcode
 *
 * Authenticated calls carry the token in the X-Fbx-App-Auth header.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#include "freeprobe/core/cancel_token.hpp"
#include "freeprobe/core/device_descriptor.hpp"
#include "freeprobe/core/export.hpp"
#include "freeprobe/net/http_client.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace freeprobe {
namespace core {

/// Header carrying the session token.
constexpr const char* SESSION_HEADER = "X-Fbx-App-Auth";

/**
 * @enum RegistrationState
 * @brief Progress of the application authorization handshake.
 */
enum class RegistrationState {
    UNREGISTERED,
    AWAITING_USER_APPROVAL,
    GRANTED,
    DENIED,
    TIMED_OUT
};

/**
 * @struct SessionConfig
 * @brief Application identity and protocol timing.
 */
struct FREEPROBE_CORE_API SessionConfig {
    std::string app_name = "FreeProbe";
    std::string app_version = "0.1.0";
    std::string device_name;                  ///< Shown on the device; defaults to "freeprobe"
    int http_timeout_ms = net::DEFAULT_HTTP_TIMEOUT_MS;
    int poll_interval_ms = 2000;              ///< Delay between approval polls
    int poll_limit = 60;                      ///< Maximum number of approval polls
};

/**
 * @struct Registration
 * @brief What a granted registration yields.
 */
struct FREEPROBE_CORE_API Registration {
    std::string appToken;
    int64_t trackId = 0;
};

/**
 * @class AuthenticatedApi
 * @brief Source of authenticated API responses, as used by the collector.
 */
class FREEPROBE_CORE_API AuthenticatedApi {
public:
    virtual ~AuthenticatedApi() = default;

    /**
     * @return The JSON body of a successful envelope for `path`.
     * @throws AuthError if the session cannot be (re)established.
     * @throws CollectError for any other failure of this call.
     */
    virtual std::string authenticatedGet(const std::string& path) = 0;
};

/**
 * @class DeviceSession
 * @brief Talks to one device's API on behalf of one application identity.
 *
 * Used from a single control thread; only the session refresh is
 * serialized by a mutex.
 */
class FREEPROBE_CORE_API DeviceSession : public AuthenticatedApi {
public:
    /**
     * @param sleep Waits between approval polls (default: std::this_thread::sleep_for).
     * @param cancel Checked before every poll; may be null.
     */
    DeviceSession(DeviceDescriptor device,
                  net::HttpClient& http,
                  SessionConfig config = SessionConfig(),
                  SleepFunction sleep = SleepFunction(),
                  const CancelToken* cancel = nullptr);

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    /// "fr.freebox." + lower-cased application name.
    static std::string makeAppId(const std::string& appName);

    const DeviceDescriptor& device() const { return device_; }
    const std::string& baseUrl() const { return baseUrl_; }
    const std::string& appId() const { return appId_; }
    const SessionConfig& config() const { return config_; }

    RegistrationState registrationState() const { return state_; }

    /**
     * @brief Request an application token and wait for the user's approval.
     *
     * Polls at most poll_limit times, sleeping poll_interval_ms between
     * polls (not after the last one).
     *
     * @throws AuthError with status() "denied", "timeout" or "unknown" on
     *         a terminal refusal, "approval timed out" when the poll limit
     *         is exhausted, "registration cancelled" on cancellation.
     */
    Registration registerApp();

    /**
     * @brief Exchange the application token for a session token.
     * @throws AuthError on an invalid or revoked token or a malformed reply.
     */
    std::string openSession(const std::string& appToken);

    bool hasSession() const;

    std::string sessionToken() const;

    /// Permissions granted with the current session.
    std::map<std::string, bool> permissions() const;

    /**
     * @brief GET `path` (relative to baseUrl()) with the session token.
     *
     * If the device reports an invalid session, the session is reopened
     * once and the call retried once.
     *
     * @return The JSON body of a successful envelope.
     * @throws AuthError without a session or if re-authentication fails.
     * @throws CollectError on transport failure or an unsuccessful envelope.
     */
    std::string authenticatedGet(const std::string& path) override;

    /**
     * @brief Log out and forget the session token.
     * @return False if the device did not acknowledge the logout.
     */
    bool closeSession();

private:
    DeviceDescriptor device_;
    net::HttpClient& http_;
    SessionConfig config_;
    SleepFunction sleep_;
    const CancelToken* cancel_;

    std::string baseUrl_;
    std::string appId_;
    RegistrationState state_ = RegistrationState::UNREGISTERED;

    mutable std::mutex sessionMutex_;
    std::string appToken_;
    std::string sessionToken_;
    std::map<std::string, bool> permissions_;

    std::mutex refreshMutex_;

    net::HttpRequest makeRequest(const std::string& method, const std::string& path) const;
    net::HttpResult authorizedGet(const std::string& path, const std::string& token);
    void refreshSession(const std::string& rejectedToken);
    bool isCancelled() const { return cancel_ != nullptr && cancel_->isCancelled(); }
};

}  // namespace core
}  // namespace freeprobe
