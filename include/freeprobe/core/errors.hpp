/**
 * @file errors.hpp
 * @brief Exception hierarchy for the probe components.
 *
 * Every error that reaches the runner derives from ProbeError and carries
 * a one-line message suitable for the user.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace freeprobe {
namespace core {

class ProbeError : public std::runtime_error {
public:
    explicit ProbeError(const std::string& message) : std::runtime_error(message) {}
};

/// No usable device answered discovery in time.
class NotFoundError : public ProbeError {
public:
    explicit NotFoundError(const std::string& message) : ProbeError(message) {}
};

/**
 * @brief Registration or session handshake failure.
 *
 * status() holds the device's terminal status or error code when there is
 * one ("denied", "invalid_token"...), empty otherwise.
 */
class AuthError : public ProbeError {
public:
    explicit AuthError(const std::string& message, std::string status = std::string())
        : ProbeError(message), status_(std::move(status)) {}

    const std::string& status() const { return status_; }

private:
    std::string status_;
};

/// Metrics retrieval failure (one endpoint, or all of them).
class CollectError : public ProbeError {
public:
    explicit CollectError(const std::string& message) : ProbeError(message) {}
};

/// Gateway unreachable or payload rejected.
class PublishError : public ProbeError {
public:
    explicit PublishError(const std::string& message, long httpStatus = 0)
        : ProbeError(message), httpStatus_(httpStatus) {}

    long httpStatus() const { return httpStatus_; }

private:
    long httpStatus_;
};

/// Missing/invalid stored credential or malformed descriptor.
class ConfigError : public ProbeError {
public:
    explicit ConfigError(const std::string& message) : ProbeError(message) {}
};

}  // namespace core
}  // namespace freeprobe
