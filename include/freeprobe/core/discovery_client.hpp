/**
 * @file discovery_client.hpp
 * @brief Bounded-duration mDNS/DNS-SD discovery of the device API service.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#include "freeprobe/core/device_descriptor.hpp"
#include "freeprobe/core/export.hpp"
#include "freeprobe/core/mdns_transport.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace freeprobe {
namespace core {

/// DNS-SD service type of the device API.
constexpr const char* FBX_API_SERVICE_TYPE = "_fbx-api._tcp.local.";

/// Default time to wait for the device to answer.
constexpr int DEFAULT_DISCOVERY_TIMEOUT_MS = 2000;

/**
 * @class DeviceDiscovery
 * @brief Finds one device and describes it.
 */
class FREEPROBE_CORE_API DeviceDiscovery {
public:
    virtual ~DeviceDiscovery() = default;

    /**
     * @brief Block until a usable instance of `serviceType` is resolved.
     * @throws NotFoundError if none resolves within `timeout`.
     */
    virtual DeviceDescriptor discover(const std::string& serviceType,
                                      std::chrono::milliseconds timeout) = 0;
};

/**
 * @struct DiscoveryConfig
 * @brief Discovery tuning.
 */
struct FREEPROBE_CORE_API DiscoveryConfig {
    std::string uid;                ///< Accept only the instance with this TXT uid (empty = any)
    int query_interval_ms = 1000;   ///< PTR query re-send period
    int receive_poll_ms = 100;      ///< Listener wake-up period
};

using TransportFactory = std::function<std::unique_ptr<MdnsTransport>()>;

/**
 * @class DiscoveryClient
 * @brief DeviceDiscovery over multicast DNS.
 *
 * Each discover() call opens a fresh transport, starts a listener thread
 * that sends the PTR query (re-sent every query_interval_ms), caches
 * PTR/SRV/TXT/A records and asks follow-up questions for the missing
 * pieces of an instance. The caller waits on a condition variable until
 * an instance resolves or the deadline passes. The listener is stopped
 * and joined, and the transport closed, before discover() returns or
 * throws.
 *
 * Usage:
 * @code
 * DiscoveryClient client;
 * DeviceDescriptor device = client.discover(FBX_API_SERVICE_TYPE,
 *                                           std::chrono::milliseconds(2000));
 * std::cout << device.baseUrl() << std::endl;
 * @endcode
 */
class FREEPROBE_CORE_API DiscoveryClient : public DeviceDiscovery {
public:
    /**
     * @param factory Creates the transport for each call (default: UdpMdnsTransport).
     */
    explicit DiscoveryClient(DiscoveryConfig config = DiscoveryConfig(),
                             TransportFactory factory = TransportFactory());

    DiscoveryClient(const DiscoveryClient&) = delete;
    DiscoveryClient& operator=(const DiscoveryClient&) = delete;

    DeviceDescriptor discover(const std::string& serviceType,
                              std::chrono::milliseconds timeout) override;

    /// Number of listener threads currently running (0 outside discover()).
    int activeListeners() const { return activeListeners_.load(); }

private:
    struct BrowseState;

    DiscoveryConfig config_;
    TransportFactory factory_;
    std::atomic<int> activeListeners_{0};

    void listenerLoop(BrowseState& state, MdnsTransport& transport);
    void handleMessage(BrowseState& state, const uint8_t* data, size_t length);
    void resolvePending(BrowseState& state, MdnsTransport& transport);
};

}  // namespace core
}  // namespace freeprobe
