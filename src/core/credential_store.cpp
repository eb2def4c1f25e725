/**
 * @file credential_store.cpp
 * @brief CredentialStore implementation (POSIX).
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#include "freeprobe/core/credential_store.hpp"
#include "freeprobe/core/errors.hpp"
#include "freeprobe/core/json_mapping.hpp"
#include "freeprobe/utils/logger.hpp"

#include "freebox_api.pb.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace freeprobe {
namespace core {

namespace {

std::string errnoText() {
    return std::strerror(errno);
}

bool writeAll(int fd, const std::string& data) {
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

void checkExistingDirectory(const std::string& directory, const struct stat& st) {
    if (!S_ISDIR(st.st_mode)) {
        throw ConfigError("Credential path " + directory + " is not a directory");
    }
    // Never change the mode of a directory the store did not create
    if ((st.st_mode & 077) != 0) {
        throw ConfigError("Credential directory " + directory +
                          " is accessible by group or others; restrict it to mode 0700");
    }
}

}  // namespace

CredentialStore::CredentialStore(std::string directory)
    : directory_(std::move(directory))
{
    while (directory_.size() > 1 && directory_.back() == '/') {
        directory_.pop_back();
    }
}

std::string CredentialStore::pathFor(const std::string& appId) const {
    return directory_ + "/" + appId + ".json";
}

bool CredentialStore::exists(const std::string& appId) const {
    struct stat st;
    return ::stat(pathFor(appId).c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

void CredentialStore::ensureDirectory() const {
    struct stat st;
    if (::stat(directory_.c_str(), &st) == 0) {
        checkExistingDirectory(directory_, st);
        return;
    }

    if (::mkdir(directory_.c_str(), 0700) != 0) {
        if (errno == EEXIST && ::stat(directory_.c_str(), &st) == 0) {
            checkExistingDirectory(directory_, st);
            return;
        }
        throw ConfigError("Cannot create credential directory " + directory_ + ": " +
                          errnoText());
    }
    LOG_DEBUG("Credentials", "Created credential directory {}", directory_);
    // mkdir honours the umask; make the mode explicit
    if (::chmod(directory_.c_str(), 0700) != 0) {
        throw ConfigError("Cannot restrict " + directory_ + ": " + errnoText());
    }
}

void CredentialStore::save(const Credential& credential) const {
    if (credential.appId.empty() || credential.appToken.empty()) {
        throw ConfigError("Refusing to store an incomplete credential");
    }

    ensureDirectory();

    api::StoredCredential stored;
    stored.set_app_id(credential.appId);
    stored.set_app_token(credential.appToken);
    stored.set_track_id(credential.trackId);
    stored.set_device_uid(credential.deviceUid);

    std::string json = toJson(stored, true);
    if (json.empty()) {
        throw ConfigError("Cannot serialize credential for " + credential.appId);
    }

    const std::string path = pathFor(credential.appId);
    const std::string tmp = path + ".tmp";

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        throw ConfigError("Cannot create " + tmp + ": " + errnoText());
    }

    bool ok = ::fchmod(fd, 0600) == 0 && writeAll(fd, json) && ::fsync(fd) == 0;
    std::string error = ok ? std::string() : errnoText();
    if (::close(fd) != 0 && ok) {
        ok = false;
        error = errnoText();
    }
    if (!ok) {
        ::unlink(tmp.c_str());
        throw ConfigError("Cannot write " + tmp + ": " + error);
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        error = errnoText();
        ::unlink(tmp.c_str());
        throw ConfigError("Cannot replace " + path + ": " + error);
    }

    LOG_INFO("Credentials", "Stored application token in {}", path);
}

Credential CredentialStore::load(const std::string& appId) const {
    const std::string path = pathFor(appId);

    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            throw ConfigError("No stored credential in " + path +
                              "; run with --register first");
        }
        throw ConfigError("Cannot access " + path + ": " + errnoText());
    }
    if (!S_ISREG(st.st_mode)) {
        throw ConfigError(path + " is not a regular file");
    }
    if ((st.st_mode & 077) != 0) {
        throw ConfigError("Credential file " + path +
                          " is accessible by group or others; restrict it to mode 0600");
    }

    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot read " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    api::StoredCredential stored;
    std::string error;
    if (!fromJson(buffer.str(), stored, &error)) {
        throw ConfigError("Malformed credential file " + path + ": " + error);
    }
    if (stored.app_id() != appId) {
        throw ConfigError("Credential file " + path + " belongs to '" + stored.app_id() + "'");
    }
    if (stored.app_token().empty()) {
        throw ConfigError("Credential file " + path + " has no app_token");
    }

    Credential credential;
    credential.appId = stored.app_id();
    credential.appToken = stored.app_token();
    credential.trackId = stored.track_id();
    credential.deviceUid = stored.device_uid();

    LOG_DEBUG("Credentials", "Loaded credential for {} from {}", appId, path);
    return credential;
}

}  // namespace core
}  // namespace freeprobe
