/**
 * @file device_descriptor.hpp
 * @brief Immutable snapshot of a resolved device API service.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#include "freeprobe/core/export.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace freeprobe {
namespace core {

/// Decoded TXT attributes, keyed by lower-case attribute name.
using TxtRecord = std::map<std::string, std::string>;

// TXT keys advertised by the device
constexpr const char* TXT_API_VERSION = "api_version";
constexpr const char* TXT_API_BASE_URL = "api_base_url";
constexpr const char* TXT_API_DOMAIN = "api_domain";
constexpr const char* TXT_DEVICE_TYPE = "device_type";
constexpr const char* TXT_UID = "uid";
constexpr const char* TXT_HTTPS_AVAILABLE = "https_available";
constexpr const char* TXT_HTTPS_PORT = "https_port";
constexpr const char* TXT_BOX_MODEL = "box_model";
constexpr const char* TXT_BOX_MODEL_NAME = "box_model_name";

/**
 * @brief Decode TXT character-strings into key/value pairs.
 *
 * Each entry is split on its first '='; an entry without '=' is a boolean
 * attribute and maps to "". Keys are lower-cased, the first occurrence of
 * a key wins, and entries that are not valid UTF-8 or have an empty key
 * are dropped.
 */
FREEPROBE_CORE_API TxtRecord decodeTxtRecord(const std::vector<std::string>& entries);

/**
 * @brief True if `version` is digits, a dot, then dot-separated digit groups.
 */
FREEPROBE_CORE_API bool isValidApiVersion(const std::string& version);

/**
 * @struct ServiceRecord
 * @brief Raw result of resolving one DNS-SD instance.
 */
struct FREEPROBE_CORE_API ServiceRecord {
    std::string name;               ///< Instance name ("Freebox Server._fbx-api._tcp.local")
    std::string serviceType;        ///< "_fbx-api._tcp.local."
    std::string serverHostname;     ///< SRV target
    std::array<uint8_t, 4> address{};
    uint16_t port = 0;
    TxtRecord txt;
};

/**
 * @class DeviceDescriptor
 * @brief Validated, read-only view of a ServiceRecord.
 *
 * Can only be obtained through create(), which checks the required TXT
 * keys and the API version format, so every instance is usable.
 */
class FREEPROBE_CORE_API DeviceDescriptor {
public:
    /**
     * @brief Validate a resolved record.
     * @throws ConfigError naming the first missing or invalid attribute.
     */
    static DeviceDescriptor create(ServiceRecord record);

    /**
     * @brief Check a TXT record without building a descriptor.
     * @param reason Receives a description of the problem when false.
     */
    static bool isUsable(const TxtRecord& txt, std::string* reason = nullptr);

    const std::string& name() const { return record_.name; }
    const std::string& serviceType() const { return record_.serviceType; }
    const std::string& serverHostname() const { return record_.serverHostname; }
    const std::array<uint8_t, 4>& address() const { return record_.address; }
    uint16_t port() const { return record_.port; }
    const TxtRecord& txtRecord() const { return record_.txt; }

    /// Dotted-quad form of address().
    std::string addressString() const;

    /// TXT value for `key`, or "" if absent.
    std::string txtValue(const std::string& key) const;

    const std::string& apiVersion() const { return record_.txt.at(TXT_API_VERSION); }
    const std::string& apiBaseUrl() const { return record_.txt.at(TXT_API_BASE_URL); }
    const std::string& apiDomain() const { return record_.txt.at(TXT_API_DOMAIN); }
    const std::string& deviceType() const { return record_.txt.at(TXT_DEVICE_TYPE); }
    const std::string& uid() const { return record_.txt.at(TXT_UID); }

    bool httpsAvailable() const;

    /// Advertised HTTPS port, 443 when not advertised or invalid.
    uint16_t httpsPort() const;

    /// Major component of api_version ("8.1" -> 8).
    int apiMajorVersion() const { return majorVersion_; }

    /// https://{api_domain}{api_base_url}v{major}
    std::string baseUrl() const;

private:
    DeviceDescriptor(ServiceRecord record, int majorVersion);

    ServiceRecord record_;
    int majorVersion_;
};

}  // namespace core
}  // namespace freeprobe
