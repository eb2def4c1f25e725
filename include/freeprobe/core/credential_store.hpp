/**
 * @file credential_store.hpp
 * @brief Owner-only persistence of the application token.
 *
 * One JSON file per application identity, `<dir>/<app_id>.json`. The
 * directory is created with mode 0700 and the file with mode 0600. An
 * existing directory, or a file, that group or others can access is
 * refused rather than re-permissioned.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#include "freeprobe/core/export.hpp"

#include <cstdint>
#include <string>

namespace freeprobe {
namespace core {

/**
 * @struct Credential
 * @brief What registration grants, plus the device it was granted by.
 */
struct FREEPROBE_CORE_API Credential {
    std::string appId;
    std::string appToken;
    int64_t trackId = 0;
    std::string deviceUid;
};

/**
 * @class CredentialStore
 * @brief Reads and writes Credential files.
 *
 * All failures are reported as ConfigError.
 */
class FREEPROBE_CORE_API CredentialStore {
public:
    explicit CredentialStore(std::string directory);

    const std::string& directory() const { return directory_; }

    std::string pathFor(const std::string& appId) const;

    bool exists(const std::string& appId) const;

    /**
     * @brief Atomically write the credential (temp file + rename).
     * @throws ConfigError on any filesystem failure.
     */
    void save(const Credential& credential) const;

    /**
     * @brief Load the credential for `appId`.
     * @throws ConfigError if missing, unreadable, malformed or too permissive.
     */
    Credential load(const std::string& appId) const;

private:
    std::string directory_;

    void ensureDirectory() const;
};

}  // namespace core
}  // namespace freeprobe
