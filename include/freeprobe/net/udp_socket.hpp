/**
 * @file udp_socket.hpp
 * @brief UDP socket with multicast support.
 *
 * RAII wrapper around a UDP socket with multicast group join/leave,
 * TTL configuration and timeout-based receive. Used as the mDNS
 * transport.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#include "freeprobe/net/export.hpp"
#include "freeprobe/net/platform.hpp"

#include <cstdint>
#include <string>

namespace freeprobe {
namespace net {

/**
 * @struct SocketAddress
 * @brief IP address and port pair.
 */
struct FREEPROBE_NET_API SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : ip("0.0.0.0"), port(0) {}
    SocketAddress(const std::string& ip_, uint16_t port_) : ip(ip_), port(port_) {}

    std::string toString() const { return ip + ":" + std::to_string(port); }

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }
};

/**
 * @class UdpSocket
 * @brief RAII UDP socket wrapper with multicast support.
 *
 * The socket is created by the constructor; a closed socket can be
 * replaced by move-assigning a fresh UdpSocket.
 *
 * Usage:
 * @code
 * UdpSocket sock;
 * sock.setReuseAddress(true);
 * sock.bind(5353);
 * sock.joinMulticastGroup("224.0.0.251");
 *
 * std::vector<uint8_t> buffer(9000);
 * SocketAddress sender;
 * int received = sock.receiveFrom(buffer.data(), buffer.size(), 100, sender);
 * @endcode
 */
class FREEPROBE_NET_API UdpSocket {
public:
    UdpSocket();
    ~UdpSocket();

    // Non-copyable, but movable
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }

    SocketHandle handle() const { return socket_; }

    /**
     * @brief Bind the socket to a local port.
     * @param port The port to bind to (0 for auto-assign).
     * @param address The local address to bind to (default: any).
     */
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    /**
     * @brief Get the local port the socket is bound to (0 if unbound).
     */
    uint16_t getLocalPort() const;

    /**
     * @brief Enable SO_REUSEADDR and SO_REUSEPORT. Call before bind().
     *
     * Needed to share UDP 5353 with a system mDNS responder.
     */
    bool setReuseAddress(bool enable);

    /**
     * @brief Set the multicast TTL (mDNS uses 255).
     */
    bool setMulticastTTL(int ttl);

    /**
     * @brief Join a multicast group.
     * @param groupAddress Multicast group IP (e.g., "224.0.0.251").
     * @param interfaceAddress Local interface IP (empty = default).
     */
    bool joinMulticastGroup(const std::string& groupAddress,
                            const std::string& interfaceAddress = "");

    bool leaveMulticastGroup(const std::string& groupAddress,
                             const std::string& interfaceAddress = "");

    /**
     * @return Number of bytes sent, or -1 on error.
     */
    int sendTo(const SocketAddress& dest, const void* data, size_t length);

    /**
     * @brief Receive data with timeout.
     * @param timeoutMs Timeout in milliseconds (0 = non-blocking, -1 = infinite).
     * @return Number of bytes received, 0 on timeout, -1 on error.
     */
    int receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                    SocketAddress& sender);

    void close();

    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    int lastError_;

    void setLastError();
    bool parseIPv4(const std::string& address, struct in_addr& out) const;
};

}  // namespace net
}  // namespace freeprobe
