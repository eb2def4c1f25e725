/**
 * @file device_descriptor.cpp
 * @brief DeviceDescriptor and TXT decoding.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#include "freeprobe/core/device_descriptor.hpp"
#include "freeprobe/core/errors.hpp"
#include "freeprobe/utils/logger.hpp"
#include "freeprobe/utils/string_utils.hpp"

#include <cstdlib>

namespace freeprobe {
namespace core {

namespace {

const char* const REQUIRED_KEYS[] = {
    TXT_API_VERSION, TXT_API_BASE_URL, TXT_API_DOMAIN, TXT_DEVICE_TYPE, TXT_UID,
};

}  // namespace

TxtRecord decodeTxtRecord(const std::vector<std::string>& entries) {
    TxtRecord txt;
    for (const auto& entry : entries) {
        if (!utils::is_valid_utf8(entry)) {
            LOG_WARN("Discovery", "Skipping TXT entry that is not valid UTF-8 ({} bytes)",
                     entry.size());
            continue;
        }

        std::string key;
        std::string value;
        size_t eq = entry.find('=');
        if (eq == std::string::npos) {
            key = entry;
        } else {
            key = entry.substr(0, eq);
            value = entry.substr(eq + 1);
        }

        key = utils::to_lower(key);
        if (key.empty()) {
            continue;
        }
        // RFC 6763 6.4: only the first occurrence of a key counts
        txt.emplace(std::move(key), std::move(value));
    }
    return txt;
}

bool isValidApiVersion(const std::string& version) {
    auto parts = utils::split(version, '.');
    if (parts.size() < 2) {
        return false;
    }
    for (const auto& part : parts) {
        if (!utils::is_digits(part)) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// DeviceDescriptor
// =============================================================================

DeviceDescriptor::DeviceDescriptor(ServiceRecord record, int majorVersion)
    : record_(std::move(record))
    , majorVersion_(majorVersion)
{
}

bool DeviceDescriptor::isUsable(const TxtRecord& txt, std::string* reason) {
    for (const char* key : REQUIRED_KEYS) {
        auto it = txt.find(key);
        if (it == txt.end() || it->second.empty()) {
            if (reason) {
                *reason = std::string("missing TXT attribute '") + key + "'";
            }
            return false;
        }
    }

    const std::string& version = txt.at(TXT_API_VERSION);
    if (!isValidApiVersion(version)) {
        if (reason) {
            *reason = "invalid api_version '" + version + "'";
        }
        return false;
    }
    return true;
}

DeviceDescriptor DeviceDescriptor::create(ServiceRecord record) {
    std::string reason;
    if (!isUsable(record.txt, &reason)) {
        throw ConfigError("Unusable device record '" + record.name + "': " + reason);
    }

    const std::string& version = record.txt.at(TXT_API_VERSION);
    int major = std::atoi(version.substr(0, version.find('.')).c_str());
    return DeviceDescriptor(std::move(record), major);
}

std::string DeviceDescriptor::addressString() const {
    const auto& a = record_.address;
    return std::to_string(a[0]) + "." + std::to_string(a[1]) + "." +
           std::to_string(a[2]) + "." + std::to_string(a[3]);
}

std::string DeviceDescriptor::txtValue(const std::string& key) const {
    auto it = record_.txt.find(key);
    return it == record_.txt.end() ? std::string() : it->second;
}

bool DeviceDescriptor::httpsAvailable() const {
    return txtValue(TXT_HTTPS_AVAILABLE) == "1";
}

uint16_t DeviceDescriptor::httpsPort() const {
    std::string value = txtValue(TXT_HTTPS_PORT);
    if (utils::is_digits(value) && value.size() <= 5) {
        long port = std::strtol(value.c_str(), nullptr, 10);
        if (port > 0 && port <= 65535) {
            return static_cast<uint16_t>(port);
        }
    }
    return 443;
}

std::string DeviceDescriptor::baseUrl() const {
    return "https://" + apiDomain() + apiBaseUrl() + "v" + std::to_string(majorVersion_);
}

}  // namespace core
}  // namespace freeprobe
