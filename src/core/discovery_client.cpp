/**
 * @file discovery_client.cpp
 * @brief DiscoveryClient implementation.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#include "freeprobe/core/discovery_client.hpp"
#include "freeprobe/core/dns_message.hpp"
#include "freeprobe/core/errors.hpp"
#include "freeprobe/utils/logger.hpp"

#include <algorithm>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace freeprobe {
namespace core {

/**
 * Record cache and result for one discover() call. Guarded by `mutex`
 * except for `lastAsked`, which only the listener touches.
 */
struct DiscoveryClient::BrowseState {
    std::string serviceType;               ///< canonical form
    std::string requestedType;             ///< as passed by the caller
    std::atomic<bool> running{true};

    std::mutex mutex;
    std::condition_variable cv;

    std::vector<std::string> instances;    ///< PTR targets in arrival order
    std::map<std::string, dns::SrvData> srv;
    std::map<std::string, std::vector<std::string>> txt;
    std::map<std::string, std::array<uint8_t, 4>> hosts;
    std::set<std::string> rejected;

    bool found = false;
    ServiceRecord result;

    std::map<std::string, std::chrono::steady_clock::time_point> lastAsked;
};

namespace {

/// Stops the listener and closes the transport on every exit path.
class ListenerScope {
public:
    ListenerScope(std::atomic<bool>& running, std::thread& thread, MdnsTransport& transport)
        : running_(running), thread_(thread), transport_(transport) {}

    ~ListenerScope() {
        running_.store(false);
        if (thread_.joinable()) {
            thread_.join();
        }
        transport_.close();
    }

    ListenerScope(const ListenerScope&) = delete;
    ListenerScope& operator=(const ListenerScope&) = delete;

private:
    std::atomic<bool>& running_;
    std::thread& thread_;
    MdnsTransport& transport_;
};

}  // namespace

DiscoveryClient::DiscoveryClient(DiscoveryConfig config, TransportFactory factory)
    : config_(std::move(config))
    , factory_(std::move(factory))
{
    if (!factory_) {
        factory_ = []() -> std::unique_ptr<MdnsTransport> {
            return std::make_unique<UdpMdnsTransport>();
        };
    }
}

DeviceDescriptor DiscoveryClient::discover(const std::string& serviceType,
                                           std::chrono::milliseconds timeout) {
    LOG_INFO("Discovery", "Browsing for {} ({} ms)", serviceType, timeout.count());

    std::unique_ptr<MdnsTransport> transport = factory_();
    if (!transport || !transport->open()) {
        throw NotFoundError("Unable to open the mDNS discovery socket");
    }

    BrowseState state;
    state.serviceType = dns::canonicalName(serviceType);
    state.requestedType = serviceType;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::thread listener;
    {
        ListenerScope scope(state.running, listener, *transport);
        activeListeners_.fetch_add(1);
        listener = std::thread([this, &state, &transport]() {
            listenerLoop(state, *transport);
            activeListeners_.fetch_sub(1);
        });

        std::unique_lock<std::mutex> lock(state.mutex);
        state.cv.wait_until(lock, deadline, [&state]() { return state.found; });
    }

    // Listener joined: state is no longer shared
    if (!state.found) {
        throw NotFoundError("No " + serviceType + " service found within " +
                            std::to_string(timeout.count()) + " ms");
    }

    std::string chosen = dns::canonicalName(state.result.name);
    for (const auto& instance : state.instances) {
        if (dns::canonicalName(instance) != chosen) {
            LOG_WARN("Discovery", "Ignoring additional instance '{}' (selected '{}')",
                     instance, state.result.name);
        }
    }

    DeviceDescriptor device = DeviceDescriptor::create(std::move(state.result));
    LOG_INFO("Discovery", "Found '{}' at {}:{} (uid {}, api {})", device.name(),
             device.addressString(), device.port(), device.uid(), device.apiVersion());
    return device;
}

void DiscoveryClient::listenerLoop(BrowseState& state, MdnsTransport& transport) {
    LOG_DEBUG("Discovery", "Listener started");

    std::vector<uint8_t> buffer(9000);
    const auto queryInterval = std::chrono::milliseconds(config_.query_interval_ms);
    auto lastQuery = std::chrono::steady_clock::time_point();
    bool queried = false;

    while (state.running.load()) {
        auto now = std::chrono::steady_clock::now();
        if (!queried || now - lastQuery >= queryInterval) {
            dns::Question question;
            question.name = state.serviceType;
            question.type = dns::TYPE_PTR;
            question.unicast_response = transport.wantsUnicastResponses();
            transport.send(dns::encodeQuery({question}));
            lastQuery = now;
            queried = true;
        }

        int received = transport.receive(buffer.data(), buffer.size(), config_.receive_poll_ms);
        if (received > 0) {
            handleMessage(state, buffer.data(), static_cast<size_t>(received));
            resolvePending(state, transport);
        } else if (received < 0 && state.running.load()) {
            LOG_WARN("Discovery", "Receive error on discovery socket");
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.receive_poll_ms));
        }

        std::lock_guard<std::mutex> lock(state.mutex);
        if (state.found) {
            break;
        }
    }

    LOG_DEBUG("Discovery", "Listener stopped");
}

void DiscoveryClient::handleMessage(BrowseState& state, const uint8_t* data, size_t length) {
    dns::Message message;
    if (!dns::parseMessage(data, length, message)) {
        LOG_DEBUG("Discovery", "Dropping malformed packet ({} bytes)", length);
        return;
    }
    if (!message.isResponse()) {
        return;
    }

    std::lock_guard<std::mutex> lock(state.mutex);
    for (const auto& rr : message.records) {
        std::string key = dns::canonicalName(rr.name);
        switch (rr.type) {
            case dns::TYPE_PTR: {
                if (key != state.serviceType) {
                    break;
                }
                std::string target = dns::canonicalName(rr.ptr);
                auto it = std::find_if(state.instances.begin(), state.instances.end(),
                                       [&target](const std::string& n) {
                                           return dns::canonicalName(n) == target;
                                       });
                if (rr.ttl == 0) {
                    if (it != state.instances.end()) {
                        LOG_DEBUG("Discovery", "Instance removed: {}", rr.ptr);
                        state.instances.erase(it);
                    }
                } else if (it == state.instances.end()) {
                    LOG_DEBUG("Discovery", "Instance added: {}", rr.ptr);
                    state.instances.push_back(rr.ptr);
                }
                break;
            }
            case dns::TYPE_SRV:
                if (rr.ttl == 0) {
                    state.srv.erase(key);
                } else {
                    state.srv[key] = rr.srv;
                }
                break;
            case dns::TYPE_TXT:
                state.txt[key] = rr.txt;
                state.rejected.erase(key);
                break;
            case dns::TYPE_A:
                state.hosts[key] = rr.a;
                break;
            default:
                break;
        }
    }
}

void DiscoveryClient::resolvePending(BrowseState& state, MdnsTransport& transport) {
    std::vector<dns::Question> questions;
    const bool unicast = transport.wantsUnicastResponses();
    const auto now = std::chrono::steady_clock::now();
    const auto interval = std::chrono::milliseconds(config_.query_interval_ms);

    auto ask = [&](const std::string& name, uint16_t type) {
        std::string key = dns::canonicalName(name) + "/" + std::to_string(type);
        auto it = state.lastAsked.find(key);
        if (it != state.lastAsked.end() && now - it->second < interval) {
            return;
        }
        state.lastAsked[key] = now;
        dns::Question q;
        q.name = name;
        q.type = type;
        q.unicast_response = unicast;
        questions.push_back(q);
    };

    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (state.found) {
            return;
        }

        for (const auto& instance : state.instances) {
            std::string key = dns::canonicalName(instance);
            if (state.rejected.count(key)) {
                continue;
            }

            auto srvIt = state.srv.find(key);
            auto txtIt = state.txt.find(key);
            if (srvIt == state.srv.end()) {
                ask(instance, dns::TYPE_SRV);
            }
            if (txtIt == state.txt.end()) {
                ask(instance, dns::TYPE_TXT);
            }
            if (srvIt == state.srv.end()) {
                continue;
            }

            auto hostIt = state.hosts.find(dns::canonicalName(srvIt->second.target));
            if (hostIt == state.hosts.end()) {
                ask(srvIt->second.target, dns::TYPE_A);
                continue;
            }
            if (txtIt == state.txt.end()) {
                continue;
            }

            ServiceRecord record;
            record.name = instance;
            record.serviceType = state.requestedType;
            record.serverHostname = srvIt->second.target;
            record.address = hostIt->second;
            record.port = srvIt->second.port;
            record.txt = decodeTxtRecord(txtIt->second);

            std::string reason;
            if (!DeviceDescriptor::isUsable(record.txt, &reason)) {
                LOG_WARN("Discovery", "Ignoring '{}': {}", instance, reason);
                state.rejected.insert(key);
                continue;
            }
            if (!config_.uid.empty() && record.txt[TXT_UID] != config_.uid) {
                LOG_DEBUG("Discovery", "Ignoring '{}': uid {} does not match {}",
                          instance, record.txt[TXT_UID], config_.uid);
                state.rejected.insert(key);
                continue;
            }

            state.result = std::move(record);
            state.found = true;
            break;
        }
    }

    if (state.found) {
        state.cv.notify_all();
        return;
    }

    if (!questions.empty()) {
        std::vector<uint8_t> packet = dns::encodeQuery(questions);
        if (!packet.empty()) {
            transport.send(packet);
        }
    }
}

}  // namespace core
}  // namespace freeprobe
