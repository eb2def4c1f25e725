/**
 * @file probe_runner.hpp
 * @brief One probe cycle: discover, authenticate, collect, publish.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#include "freeprobe/core/cancel_token.hpp"
#include "freeprobe/core/credential_store.hpp"
#include "freeprobe/core/device_session.hpp"
#include "freeprobe/core/discovery_client.hpp"
#include "freeprobe/core/export.hpp"
#include "freeprobe/core/metrics_collector.hpp"
#include "freeprobe/core/metrics_publisher.hpp"
#include "freeprobe/net/http_client.hpp"

#include <chrono>
#include <ostream>
#include <string>
#include <vector>

namespace freeprobe {
namespace core {

/**
 * @struct RunOptions
 * @brief Per-run mode switches.
 */
struct FREEPROBE_CORE_API RunOptions {
    bool register_app = false;      ///< Register and store the token, collect nothing
    bool dry_run = false;           ///< Print metrics instead of pushing them
    std::chrono::milliseconds discovery_timeout{DEFAULT_DISCOVERY_TIMEOUT_MS};
};

/**
 * @struct RunnerConfig
 * @brief Everything a cycle needs that does not change between runs.
 */
struct FREEPROBE_CORE_API RunnerConfig {
    std::string service_type = FBX_API_SERVICE_TYPE;
    SessionConfig session;
    GatewayConfig gateway;
    std::string metrics_prefix = DEFAULT_METRICS_PREFIX;
    std::vector<Endpoint> endpoints = defaultEndpoints();
};

/**
 * @class ProbeRunner
 * @brief Orchestrates a cycle and owns the top-level error policy.
 *
 * run() never throws a ProbeError: it reports it as one line on the
 * error stream and returns 1.
 */
class FREEPROBE_CORE_API ProbeRunner {
public:
    ProbeRunner(RunnerConfig config,
                DeviceDiscovery& discovery,
                net::HttpClient& http,
                const CredentialStore& credentials,
                std::ostream& out,
                std::ostream& err,
                SleepFunction sleep = SleepFunction(),
                const CancelToken* cancel = nullptr);

    /**
     * @return 0 on success, 1 on any handled failure.
     */
    int run(const RunOptions& options);

private:
    RunnerConfig config_;
    DeviceDiscovery& discovery_;
    net::HttpClient& http_;
    const CredentialStore& credentials_;
    std::ostream& out_;
    std::ostream& err_;
    SleepFunction sleep_;
    const CancelToken* cancel_;

    void runCycle(const RunOptions& options);
    void registerApp(DeviceSession& session);
    void collectAndPublish(DeviceSession& session, const RunOptions& options);
};

}  // namespace core
}  // namespace freeprobe
