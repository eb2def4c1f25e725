/**
 * @file mdns_transport.hpp
 * @brief Datagram transport used by the discovery listener.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#include "freeprobe/core/export.hpp"
#include "freeprobe/net/udp_socket.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace freeprobe {
namespace core {

/**
 * @class MdnsTransport
 * @brief Sends queries to and receives packets from the mDNS group.
 *
 * send() and receive() may be called from different threads; open() and
 * close() are called by the owner only while no other thread uses it.
 */
class FREEPROBE_CORE_API MdnsTransport {
public:
    virtual ~MdnsTransport() = default;

    virtual bool open() = 0;

    virtual bool send(const std::vector<uint8_t>& packet) = 0;

    /**
     * @return Bytes received, 0 on timeout, -1 on error.
     */
    virtual int receive(uint8_t* buffer, size_t size, int timeoutMs) = 0;

    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    /// True when replies will be unicast to us (QU bit must be set in queries).
    virtual bool wantsUnicastResponses() const { return false; }
};

/**
 * @class UdpMdnsTransport
 * @brief MdnsTransport on a multicast UDP socket.
 *
 * Binds UDP 5353 with address reuse so a system responder can coexist.
 * If that port cannot be bound, falls back to an ephemeral port and asks
 * responders for unicast replies.
 */
class FREEPROBE_CORE_API UdpMdnsTransport : public MdnsTransport {
public:
    UdpMdnsTransport() = default;
    ~UdpMdnsTransport() override;

    bool open() override;
    bool send(const std::vector<uint8_t>& packet) override;
    int receive(uint8_t* buffer, size_t size, int timeoutMs) override;
    void close() override;
    bool isOpen() const override { return open_; }
    bool wantsUnicastResponses() const override { return unicast_; }

private:
    net::UdpSocket socket_;
    bool open_ = false;
    bool joined_ = false;
    bool unicast_ = false;
};

}  // namespace core
}  // namespace freeprobe
