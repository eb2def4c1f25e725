/**
 * @file mdns_transport.cpp
 * @brief UdpMdnsTransport implementation.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#include "freeprobe/core/mdns_transport.hpp"
#include "freeprobe/core/dns_message.hpp"
#include "freeprobe/utils/logger.hpp"

namespace freeprobe {
namespace core {

UdpMdnsTransport::~UdpMdnsTransport() {
    close();
}

bool UdpMdnsTransport::open() {
    if (open_) {
        return true;
    }

    // A previously closed socket cannot be reused
    if (!socket_.isValid()) {
        socket_ = net::UdpSocket();
        if (!socket_.isValid()) {
            LOG_ERROR("Mdns", "Failed to create socket: {}", socket_.getLastError());
            return false;
        }
    }

    unicast_ = false;
    if (!socket_.setReuseAddress(true)) {
        LOG_WARN("Mdns", "Failed to set SO_REUSEADDR");
    }

    if (socket_.bind(dns::MDNS_PORT)) {
        if (socket_.joinMulticastGroup(dns::MDNS_GROUP)) {
            joined_ = true;
        } else {
            LOG_WARN("Mdns", "Failed to join {}, relying on unicast replies", dns::MDNS_GROUP);
            unicast_ = true;
        }
    } else {
        LOG_DEBUG("Mdns", "Port {} unavailable ({}), using an ephemeral port",
                  dns::MDNS_PORT, socket_.getLastError());
        socket_ = net::UdpSocket();
        if (!socket_.isValid() || !socket_.bind(0)) {
            LOG_ERROR("Mdns", "Failed to bind discovery socket: {}", socket_.getLastError());
            socket_.close();
            return false;
        }
        unicast_ = true;
    }

    if (!socket_.setMulticastTTL(255)) {
        LOG_WARN("Mdns", "Failed to set multicast TTL");
    }

    open_ = true;
    LOG_DEBUG("Mdns", "Transport open on port {}{}", socket_.getLocalPort(),
              unicast_ ? " (unicast replies)" : "");
    return true;
}

bool UdpMdnsTransport::send(const std::vector<uint8_t>& packet) {
    if (!open_) {
        return false;
    }
    net::SocketAddress dest(dns::MDNS_GROUP, dns::MDNS_PORT);
    int sent = socket_.sendTo(dest, packet.data(), packet.size());
    if (sent < 0) {
        LOG_WARN("Mdns", "Failed to send query: {}", socket_.getLastError());
        return false;
    }
    LOG_TRACE("Mdns", "Sent query ({} bytes)", sent);
    return true;
}

int UdpMdnsTransport::receive(uint8_t* buffer, size_t size, int timeoutMs) {
    if (!open_) {
        return -1;
    }
    net::SocketAddress sender;
    int received = socket_.receiveFrom(buffer, size, timeoutMs, sender);
    if (received > 0) {
        LOG_TRACE("Mdns", "Received {} bytes from {}", received, sender.toString());
    }
    return received;
}

void UdpMdnsTransport::close() {
    if (!open_) {
        return;
    }
    if (joined_) {
        socket_.leaveMulticastGroup(dns::MDNS_GROUP);
        joined_ = false;
    }
    socket_.close();
    open_ = false;
    LOG_DEBUG("Mdns", "Transport closed");
}

}  // namespace core
}  // namespace freeprobe
