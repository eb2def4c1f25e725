/**
 * @file hmac.cpp
 * @brief HMAC-SHA1 implementation on top of OpenSSL.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#include "freeprobe/utils/hmac.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace freeprobe {
namespace utils {

bool hmacSha1(const std::string& key, const std::string& message, Sha1Digest& digest) {
    unsigned int length = 0;
    const unsigned char* result = HMAC(EVP_sha1(),
                                       key.data(), static_cast<int>(key.size()),
                                       reinterpret_cast<const unsigned char*>(message.data()),
                                       message.size(),
                                       digest.data(), &length);
    return result != nullptr && length == SHA1_DIGEST_SIZE;
}

std::string hmacSha1Hex(const std::string& key, const std::string& message) {
    Sha1Digest digest{};
    if (!hmacSha1(key, message, digest)) {
        return std::string();
    }
    return toHex(digest.data(), digest.size());
}

std::string toHex(const uint8_t* data, std::size_t length) {
    static const char digits[] = "0123456789abcdef";

    std::string out;
    out.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

}  // namespace utils
}  // namespace freeprobe
