/**
 * @file probe_runner.cpp
 * @brief ProbeRunner implementation.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#include "freeprobe/core/probe_runner.hpp"
#include "freeprobe/core/errors.hpp"
#include "freeprobe/utils/logger.hpp"

namespace freeprobe {
namespace core {

namespace {

/// Logs out when the collection scope ends, whatever the outcome.
class SessionScope {
public:
    explicit SessionScope(DeviceSession& session) : session_(session) {}

    ~SessionScope() {
        if (!session_.closeSession()) {
            LOG_WARN("Runner", "Logout was not acknowledged");
        }
    }

    SessionScope(const SessionScope&) = delete;
    SessionScope& operator=(const SessionScope&) = delete;

private:
    DeviceSession& session_;
};

}  // namespace

ProbeRunner::ProbeRunner(RunnerConfig config,
                         DeviceDiscovery& discovery,
                         net::HttpClient& http,
                         const CredentialStore& credentials,
                         std::ostream& out,
                         std::ostream& err,
                         SleepFunction sleep,
                         const CancelToken* cancel)
    : config_(std::move(config))
    , discovery_(discovery)
    , http_(http)
    , credentials_(credentials)
    , out_(out)
    , err_(err)
    , sleep_(std::move(sleep))
    , cancel_(cancel)
{
}

int ProbeRunner::run(const RunOptions& options) {
    try {
        runCycle(options);
        return 0;
    } catch (const ProbeError& e) {
        LOG_DEBUG("Runner", "Cycle failed: {}", e.what());
        err_ << "freeprobe: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        LOG_ERROR("Runner", "Unexpected failure: {}", e.what());
        err_ << "freeprobe: unexpected error: " << e.what() << std::endl;
    }
    return 1;
}

void ProbeRunner::runCycle(const RunOptions& options) {
    DeviceDescriptor device = discovery_.discover(config_.service_type, options.discovery_timeout);

    DeviceSession session(device, http_, config_.session, sleep_, cancel_);

    if (options.register_app) {
        registerApp(session);
    } else {
        collectAndPublish(session, options);
    }
}

void ProbeRunner::registerApp(DeviceSession& session) {
    out_ << "Registering " << session.appId() << " with " << session.device().name()
         << ": please confirm on the device front panel." << std::endl;

    Registration registration = session.registerApp();

    Credential credential;
    credential.appId = session.appId();
    credential.appToken = registration.appToken;
    credential.trackId = registration.trackId;
    credential.deviceUid = session.device().uid();
    credentials_.save(credential);

    out_ << "Registration granted; token stored in "
         << credentials_.pathFor(credential.appId) << std::endl;
}

void ProbeRunner::collectAndPublish(DeviceSession& session, const RunOptions& options) {
    Credential credential = credentials_.load(session.appId());
    if (!credential.deviceUid.empty() && credential.deviceUid != session.device().uid()) {
        throw ConfigError("Stored token was granted by device " + credential.deviceUid +
                          ", not " + session.device().uid() + "; run with --register");
    }

    session.openSession(credential.appToken);
    SessionScope scope(session);

    MetricsCollector collector(config_.endpoints, config_.metrics_prefix);
    CollectResult result = collector.collect(session);

    if (!collector.endpoints().empty() &&
        result.partialFailures == static_cast<int>(collector.endpoints().size())) {
        throw CollectError("All " + std::to_string(result.partialFailures) +
                           " counter endpoints failed");
    }

    MetricsPublisher publisher(http_, config_.gateway, out_);
    publisher.publish(result.samples, options.dry_run ? PublishMode::DRY_RUN : PublishMode::LIVE);
}

}  // namespace core
}  // namespace freeprobe
