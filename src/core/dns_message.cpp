/**
 * @file dns_message.cpp
 * @brief DNS message encoding/decoding.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#include "freeprobe/core/dns_message.hpp"

#include <cctype>

namespace freeprobe {
namespace core {
namespace dns {

namespace {

constexpr size_t HEADER_SIZE = 12;
constexpr size_t MAX_LABEL = 63;
constexpr int MAX_POINTER_JUMPS = 32;

uint16_t read16(const uint8_t* p) {
    return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

uint32_t read32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

void write16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

/**
 * Read a possibly compressed name starting at `offset`. On success
 * `offset` is moved past the name as stored at that position (a pointer
 * counts as two bytes).
 */
bool readName(const uint8_t* data, size_t length, size_t& offset, std::string& name) {
    name.clear();
    size_t pos = offset;
    size_t resume = 0;
    bool jumped = false;
    int jumps = 0;

    while (true) {
        if (pos >= length) {
            return false;
        }
        uint8_t len = data[pos];

        if (len == 0) {
            offset = jumped ? resume : pos + 1;
            return true;
        }

        if ((len & 0xC0) == 0xC0) {
            if (pos + 1 >= length || ++jumps > MAX_POINTER_JUMPS) {
                return false;
            }
            size_t target = (static_cast<size_t>(len & 0x3F) << 8) | data[pos + 1];
            if (target >= length) {
                return false;
            }
            if (!jumped) {
                resume = pos + 2;
                jumped = true;
            }
            pos = target;
            continue;
        }

        if ((len & 0xC0) != 0 || pos + 1 + len > length) {
            return false;
        }
        if (!name.empty()) {
            name.push_back('.');
        }
        name.append(reinterpret_cast<const char*>(data + pos + 1), len);
        pos += 1 + len;
    }
}

bool readRecord(const uint8_t* data, size_t length, size_t& offset, ResourceRecord& rr) {
    if (!readName(data, length, offset, rr.name)) {
        return false;
    }
    if (offset + 10 > length) {
        return false;
    }

    rr.type = read16(data + offset);
    rr.rrclass = read16(data + offset + 2);
    rr.ttl = read32(data + offset + 4);
    uint16_t rdlength = read16(data + offset + 8);
    size_t rdata = offset + 10;
    size_t end = rdata + rdlength;
    if (end > length) {
        return false;
    }

    switch (rr.type) {
        case TYPE_PTR: {
            size_t p = rdata;
            if (!readName(data, length, p, rr.ptr)) {
                return false;
            }
            break;
        }
        case TYPE_SRV: {
            if (rdlength < 7) {
                return false;
            }
            rr.srv.priority = read16(data + rdata);
            rr.srv.weight = read16(data + rdata + 2);
            rr.srv.port = read16(data + rdata + 4);
            size_t p = rdata + 6;
            if (!readName(data, length, p, rr.srv.target)) {
                return false;
            }
            break;
        }
        case TYPE_TXT: {
            size_t p = rdata;
            while (p < end) {
                uint8_t len = data[p++];
                if (p + len > end) {
                    return false;
                }
                // A lone zero-length string is the "no attributes" marker
                if (len > 0) {
                    rr.txt.emplace_back(reinterpret_cast<const char*>(data + p), len);
                }
                p += len;
            }
            break;
        }
        case TYPE_A: {
            if (rdlength != 4) {
                return false;
            }
            for (size_t i = 0; i < 4; ++i) {
                rr.a[i] = data[rdata + i];
            }
            break;
        }
        default:
            break;
    }

    offset = end;
    return true;
}

}  // namespace

bool encodeName(const std::string& name, std::vector<uint8_t>& out) {
    size_t start = 0;
    while (start < name.size()) {
        size_t dot = name.find('.', start);
        if (dot == std::string::npos) {
            dot = name.size();
        }
        size_t len = dot - start;
        if (len == 0 || len > MAX_LABEL) {
            return false;
        }
        out.push_back(static_cast<uint8_t>(len));
        out.insert(out.end(), name.begin() + static_cast<std::ptrdiff_t>(start),
                   name.begin() + static_cast<std::ptrdiff_t>(dot));
        start = dot + 1;
    }
    out.push_back(0);
    return true;
}

std::vector<uint8_t> encodeQuery(const std::vector<Question>& questions) {
    std::vector<uint8_t> out;
    out.reserve(512);

    write16(out, 0);        // id
    write16(out, 0);        // flags
    write16(out, static_cast<uint16_t>(questions.size()));
    write16(out, 0);        // ancount
    write16(out, 0);        // nscount
    write16(out, 0);        // arcount

    for (const auto& q : questions) {
        if (!encodeName(q.name, out)) {
            return {};
        }
        write16(out, q.type);
        write16(out, static_cast<uint16_t>(CLASS_IN | (q.unicast_response ? UNICAST_RESPONSE_BIT : 0)));
    }
    return out;
}

bool parseMessage(const uint8_t* data, size_t length, Message& out) {
    if (length < HEADER_SIZE) {
        return false;
    }

    out = Message();
    out.id = read16(data);
    out.flags = read16(data + 2);
    uint16_t qdcount = read16(data + 4);
    uint32_t rrcount = static_cast<uint32_t>(read16(data + 6)) + read16(data + 8) + read16(data + 10);

    size_t offset = HEADER_SIZE;
    for (uint16_t i = 0; i < qdcount; ++i) {
        Question q;
        if (!readName(data, length, offset, q.name) || offset + 4 > length) {
            return false;
        }
        q.type = read16(data + offset);
        q.unicast_response = (read16(data + offset + 2) & UNICAST_RESPONSE_BIT) != 0;
        offset += 4;
        out.questions.push_back(std::move(q));
    }

    for (uint32_t i = 0; i < rrcount; ++i) {
        ResourceRecord rr;
        if (!readRecord(data, length, offset, rr)) {
            return false;
        }
        out.records.push_back(std::move(rr));
    }
    return true;
}

std::string canonicalName(const std::string& name) {
    size_t n = name.size();
    while (n > 0 && name[n - 1] == '.') {
        --n;
    }
    std::string out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(name[i]))));
    }
    return out;
}

}  // namespace dns
}  // namespace core
}  // namespace freeprobe
