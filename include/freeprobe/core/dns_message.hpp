/**
 * @file dns_message.hpp
 * @brief Minimal DNS message codec for mDNS / DNS-SD browsing.
 *
 * Encodes questions (PTR, SRV, TXT, A) and decodes the answer, authority
 * and additional sections of responses, following name compression
 * pointers. Only the record types needed to resolve a DNS-SD service
 * instance are decoded; other records are skipped.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#include "freeprobe/core/export.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace freeprobe {
namespace core {
namespace dns {

// Record types
constexpr uint16_t TYPE_A = 1;
constexpr uint16_t TYPE_PTR = 12;
constexpr uint16_t TYPE_TXT = 16;
constexpr uint16_t TYPE_SRV = 33;

constexpr uint16_t CLASS_IN = 1;

/// Top bit of the question class asks for a unicast reply (RFC 6762 5.4).
constexpr uint16_t UNICAST_RESPONSE_BIT = 0x8000;
/// Top bit of a record class marks a unique RRset (RFC 6762 10.2).
constexpr uint16_t CACHE_FLUSH_BIT = 0x8000;

constexpr uint16_t FLAG_RESPONSE = 0x8000;

constexpr const char* MDNS_GROUP = "224.0.0.251";
constexpr uint16_t MDNS_PORT = 5353;

struct FREEPROBE_CORE_API Question {
    std::string name;
    uint16_t type = TYPE_PTR;
    bool unicast_response = false;
};

struct FREEPROBE_CORE_API SrvData {
    uint16_t priority = 0;
    uint16_t weight = 0;
    uint16_t port = 0;
    std::string target;
};

/**
 * @struct ResourceRecord
 * @brief A decoded record. Only the field matching `type` is meaningful.
 */
struct FREEPROBE_CORE_API ResourceRecord {
    std::string name;
    uint16_t type = 0;
    uint16_t rrclass = CLASS_IN;
    uint32_t ttl = 0;

    std::string ptr;                    ///< TYPE_PTR target
    SrvData srv;                        ///< TYPE_SRV
    std::vector<std::string> txt;       ///< TYPE_TXT character-strings (raw bytes)
    std::array<uint8_t, 4> a{};         ///< TYPE_A address
};

struct FREEPROBE_CORE_API Message {
    uint16_t id = 0;
    uint16_t flags = 0;
    std::vector<Question> questions;
    std::vector<ResourceRecord> records;   ///< answers, authority and additionals, in order

    bool isResponse() const { return (flags & FLAG_RESPONSE) != 0; }
};

/**
 * @brief Append a domain name in wire format (uncompressed).
 * @return False if a label is empty in the middle or longer than 63 bytes.
 */
FREEPROBE_CORE_API bool encodeName(const std::string& name, std::vector<uint8_t>& out);

/**
 * @brief Build a query message (id 0, no flags, as mDNS requires).
 * @return Empty vector if a name cannot be encoded.
 */
FREEPROBE_CORE_API std::vector<uint8_t> encodeQuery(const std::vector<Question>& questions);

/**
 * @brief Decode a DNS message.
 * @return False if the header or a section is truncated or malformed.
 */
FREEPROBE_CORE_API bool parseMessage(const uint8_t* data, size_t length, Message& out);

/**
 * @brief Lower-case a name and strip trailing dots, for use as a map key.
 */
FREEPROBE_CORE_API std::string canonicalName(const std::string& name);

}  // namespace dns
}  // namespace core
}  // namespace freeprobe
