/**
 * @file hmac.hpp
 * @brief HMAC-SHA1 helper used to answer the device login challenge.
 *
 * Thin wrapper over OpenSSL's HMAC().
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#include "freeprobe/utils/export.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace freeprobe {
namespace utils {

/// SHA1 digest length in bytes.
constexpr std::size_t SHA1_DIGEST_SIZE = 20;

using Sha1Digest = std::array<uint8_t, SHA1_DIGEST_SIZE>;

/**
 * @brief Compute HMAC-SHA1 of a message.
 * @param key Secret key (raw bytes of the string).
 * @param message Message to authenticate.
 * @param digest Output digest.
 * @return False if OpenSSL failed.
 */
FREEPROBE_UTILS_API bool hmacSha1(const std::string& key, const std::string& message,
                                  Sha1Digest& digest);

/**
 * @brief Compute HMAC-SHA1 and return it as lower-case hex.
 * @return 40 hex characters, or an empty string if OpenSSL failed.
 */
FREEPROBE_UTILS_API std::string hmacSha1Hex(const std::string& key, const std::string& message);

/**
 * @brief Lower-case hex encoding of a byte buffer.
 */
FREEPROBE_UTILS_API std::string toHex(const uint8_t* data, std::size_t length);

}  // namespace utils
}  // namespace freeprobe
