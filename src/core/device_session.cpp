/**
 * @file device_session.cpp
 * @brief DeviceSession implementation.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#include "freeprobe/core/device_session.hpp"
#include "freeprobe/core/errors.hpp"
#include "freeprobe/core/json_mapping.hpp"
#include "freeprobe/utils/hmac.hpp"
#include "freeprobe/utils/logger.hpp"
#include "freeprobe/utils/string_utils.hpp"

#include "freebox_api.pb.h"

#include <thread>

namespace freeprobe {
namespace core {

namespace {

constexpr const char* APP_ID_PREFIX = "fr.freebox.";

/**
 * Decode a response envelope. Returns false with `error` set when the
 * exchange did not complete or the body is not a valid envelope; the
 * caller still has to check success().
 */
template <typename Envelope>
bool decodeEnvelope(const net::HttpResult& result, Envelope& envelope, std::string& error) {
    if (result.status_code == 0) {
        error = result.error.empty() ? std::string("no response") : result.error;
        return false;
    }
    std::string parseError;
    if (!fromJson(result.body, envelope, &parseError)) {
        error = "malformed response (HTTP " + std::to_string(result.status_code) + ")";
        LOG_DEBUG("Session", "Envelope parse error: {}", parseError);
        return false;
    }
    return true;
}

template <typename Envelope>
std::string describeFailure(const Envelope& envelope) {
    std::string text = envelope.msg().empty() ? std::string("request refused") : envelope.msg();
    if (!envelope.error_code().empty()) {
        text += " (" + envelope.error_code() + ")";
    }
    return text;
}

bool isInvalidSession(const net::HttpResult& result) {
    if (result.ok || result.status_code == 0) {
        return false;
    }
    api::StatusResponse envelope;
    if (!fromJson(result.body, envelope)) {
        return false;
    }
    return envelope.error_code() == "auth_required" || envelope.error_code() == "invalid_session";
}

}  // namespace

DeviceSession::DeviceSession(DeviceDescriptor device,
                             net::HttpClient& http,
                             SessionConfig config,
                             SleepFunction sleep,
                             const CancelToken* cancel)
    : device_(std::move(device))
    , http_(http)
    , config_(std::move(config))
    , sleep_(std::move(sleep))
    , cancel_(cancel)
{
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
    if (config_.device_name.empty()) {
        config_.device_name = "freeprobe";
    }
    baseUrl_ = device_.baseUrl();
    appId_ = makeAppId(config_.app_name);
    LOG_DEBUG("Session", "API base {} for {}", baseUrl_, appId_);
}

std::string DeviceSession::makeAppId(const std::string& appName) {
    return APP_ID_PREFIX + utils::to_lower(appName);
}

net::HttpRequest DeviceSession::makeRequest(const std::string& method,
                                            const std::string& path) const {
    net::HttpRequest request;
    request.method = method;
    request.url = baseUrl_ + path;
    request.timeout_ms = config_.http_timeout_ms;
    // The API domain must resolve to the device that answered discovery
    request.resolve.push_back(device_.apiDomain() + ":443:" + device_.addressString());
    return request;
}

// =============================================================================
// Registration
// =============================================================================

Registration DeviceSession::registerApp() {
    api::AuthorizeRequest body;
    body.set_app_id(appId_);
    body.set_app_name(config_.app_name);
    body.set_app_version(config_.app_version);
    body.set_device_name(config_.device_name);

    net::HttpRequest request = makeRequest("POST", "/login/authorize/");
    request.headers.emplace_back("Content-Type", "application/json");
    request.body = toJson(body);

    LOG_INFO("Session", "Requesting authorization for {} ({})", appId_, config_.device_name);
    net::HttpResult result = http_.perform(request);

    api::AuthorizeResponse response;
    std::string error;
    if (!decodeEnvelope(result, response, error)) {
        throw AuthError("Authorization request failed: " + error);
    }
    if (!result.ok || !response.success()) {
        throw AuthError("Authorization request refused: " + describeFailure(response),
                        response.error_code());
    }
    if (response.result().app_token().empty()) {
        throw AuthError("Authorization reply carries no app_token");
    }

    Registration registration;
    registration.appToken = response.result().app_token();
    registration.trackId = response.result().track_id();
    state_ = RegistrationState::AWAITING_USER_APPROVAL;

    LOG_INFO("Session", "Waiting for approval on the device (track id {})", registration.trackId);

    const std::string statusPath = "/login/authorize/" + std::to_string(registration.trackId);
    const int limit = config_.poll_limit > 0 ? config_.poll_limit : 1;

    for (int poll = 1; poll <= limit; ++poll) {
        if (isCancelled()) {
            state_ = RegistrationState::UNREGISTERED;
            throw AuthError("registration cancelled");
        }

        net::HttpResult reply = http_.perform(makeRequest("GET", statusPath));
        api::AuthorizeStatusResponse status;
        if (!decodeEnvelope(reply, status, error)) {
            state_ = RegistrationState::UNREGISTERED;
            throw AuthError("Authorization status request failed: " + error);
        }
        if (!reply.ok || !status.success()) {
            state_ = RegistrationState::UNREGISTERED;
            throw AuthError("Authorization status refused: " + describeFailure(status),
                            status.error_code());
        }

        const std::string& value = status.result().status();
        LOG_DEBUG("Session", "Approval poll {}/{}: {}", poll, limit, value);

        if (value == "granted") {
            state_ = RegistrationState::GRANTED;
            LOG_INFO("Session", "Application {} granted", appId_);
            return registration;
        }
        if (value == "denied") {
            state_ = RegistrationState::DENIED;
            throw AuthError("registration denied on the device", value);
        }
        if (value == "timeout") {
            state_ = RegistrationState::TIMED_OUT;
            throw AuthError("registration timed out on the device", value);
        }
        if (value == "unknown") {
            state_ = RegistrationState::UNREGISTERED;
            throw AuthError("registration unknown to the device (token revoked?)", value);
        }
        if (value != "pending") {
            state_ = RegistrationState::UNREGISTERED;
            throw AuthError("unexpected authorization status '" + value + "'", value);
        }

        if (poll < limit) {
            sleep_(std::chrono::milliseconds(config_.poll_interval_ms));
        }
    }

    state_ = RegistrationState::TIMED_OUT;
    throw AuthError("approval timed out", "pending");
}

// =============================================================================
// Session
// =============================================================================

std::string DeviceSession::openSession(const std::string& appToken) {
    if (appToken.empty()) {
        throw AuthError("No application token");
    }

    net::HttpResult reply = http_.perform(makeRequest("GET", "/login/"));
    api::LoginChallengeResponse challenge;
    std::string error;
    if (!decodeEnvelope(reply, challenge, error)) {
        throw AuthError("Login challenge request failed: " + error);
    }
    if (!reply.ok || !challenge.success()) {
        throw AuthError("Login challenge refused: " + describeFailure(challenge),
                        challenge.error_code());
    }
    if (challenge.result().challenge().empty()) {
        throw AuthError("Login challenge reply carries no challenge");
    }

    std::string password = utils::hmacSha1Hex(appToken, challenge.result().challenge());
    if (password.empty()) {
        throw AuthError("Failed to compute the session password");
    }

    api::SessionRequest body;
    body.set_app_id(appId_);
    body.set_password(password);

    net::HttpRequest request = makeRequest("POST", "/login/session/");
    request.headers.emplace_back("Content-Type", "application/json");
    request.body = toJson(body);

    reply = http_.perform(request);
    api::SessionResponse session;
    if (!decodeEnvelope(reply, session, error)) {
        throw AuthError("Session request failed: " + error);
    }
    if (!reply.ok || !session.success()) {
        throw AuthError("Session refused: " + describeFailure(session), session.error_code());
    }
    if (session.result().session_token().empty()) {
        throw AuthError("Session reply carries no session_token");
    }

    std::lock_guard<std::mutex> lock(sessionMutex_);
    appToken_ = appToken;
    sessionToken_ = session.result().session_token();
    permissions_.clear();
    for (const auto& entry : session.result().permissions()) {
        permissions_[entry.first] = entry.second;
    }

    LOG_INFO("Session", "Session opened for {} ({} permissions)", appId_, permissions_.size());
    return sessionToken_;
}

bool DeviceSession::hasSession() const {
    std::lock_guard<std::mutex> lock(sessionMutex_);
    return !sessionToken_.empty();
}

std::string DeviceSession::sessionToken() const {
    std::lock_guard<std::mutex> lock(sessionMutex_);
    return sessionToken_;
}

std::map<std::string, bool> DeviceSession::permissions() const {
    std::lock_guard<std::mutex> lock(sessionMutex_);
    return permissions_;
}

net::HttpResult DeviceSession::authorizedGet(const std::string& path, const std::string& token) {
    net::HttpRequest request = makeRequest("GET", path);
    request.headers.emplace_back(SESSION_HEADER, token);
    return http_.perform(request);
}

void DeviceSession::refreshSession(const std::string& rejectedToken) {
    std::lock_guard<std::mutex> refresh(refreshMutex_);

    std::string appToken;
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        if (!sessionToken_.empty() && sessionToken_ != rejectedToken) {
            return;  // already refreshed
        }
        sessionToken_.clear();
        appToken = appToken_;
    }

    LOG_INFO("Session", "Session expired, re-authenticating");
    openSession(appToken);
}

std::string DeviceSession::authenticatedGet(const std::string& path) {
    std::string token = sessionToken();
    if (token.empty()) {
        throw AuthError("No open session for " + path);
    }

    net::HttpResult result = authorizedGet(path, token);
    if (isInvalidSession(result)) {
        refreshSession(token);
        token = sessionToken();
        result = authorizedGet(path, token);
        if (isInvalidSession(result)) {
            {
                std::lock_guard<std::mutex> lock(sessionMutex_);
                sessionToken_.clear();
            }
            throw AuthError("Session rejected after re-authentication on " + path,
                            "invalid_session");
        }
    }

    api::StatusResponse envelope;
    std::string error;
    if (!decodeEnvelope(result, envelope, error)) {
        throw CollectError(path + ": " + error);
    }
    if (!result.ok || !envelope.success()) {
        throw CollectError(path + ": " + describeFailure(envelope));
    }
    return result.body;
}

bool DeviceSession::closeSession() {
    std::string token = sessionToken();
    if (token.empty()) {
        return true;
    }

    net::HttpRequest request = makeRequest("POST", "/login/logout/");
    request.headers.emplace_back(SESSION_HEADER, token);
    request.headers.emplace_back("Content-Type", "application/json");
    net::HttpResult result = http_.perform(request);

    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        sessionToken_.clear();
        permissions_.clear();
    }

    api::StatusResponse envelope;
    std::string error;
    if (!decodeEnvelope(result, envelope, error)) {
        LOG_WARN("Session", "Logout failed: {}", error);
        return false;
    }
    if (!result.ok || !envelope.success()) {
        LOG_WARN("Session", "Logout refused: {}", describeFailure(envelope));
        return false;
    }
    LOG_DEBUG("Session", "Logged out");
    return true;
}

}  // namespace core
}  // namespace freeprobe
