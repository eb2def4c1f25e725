/**
 * @file main.cpp
 * @brief FreeProbe entry point
 *
 * Thin executable wiring the library components together:
 * - mDNS discovery of the Freebox
 * - Registration / session with the Freebox OS API
 * - Counter collection and push to the Prometheus push gateway
 */

#include <freeprobe/app/config.hpp>
#include <freeprobe/core/credential_store.hpp>
#include <freeprobe/core/discovery_client.hpp>
#include <freeprobe/core/probe_runner.hpp>
#include <freeprobe/net/http_client.hpp>
#include <freeprobe/utils/logger.hpp>

#include <climits>
#include <csignal>
#include <iostream>
#include <string>

#include <unistd.h>

using namespace freeprobe;
using namespace freeprobe::app;

// Set by SIGINT/SIGTERM, observed by the registration poll loop
static core::CancelToken g_cancel;

void signalHandler(int /*signal*/) {
    g_cancel.cancel();
}

namespace {

std::string executableDir(const char* argv0) {
    char path[PATH_MAX];
    ssize_t n = ::readlink("/proc/self/exe", path, sizeof(path) - 1);
    std::string exe = n > 0 ? std::string(path, static_cast<size_t>(n)) : std::string(argv0);
    size_t slash = exe.find_last_of('/');
    return slash == std::string::npos ? std::string(".") : exe.substr(0, slash);
}

std::string hostName() {
    char name[256] = {0};
    if (::gethostname(name, sizeof(name) - 1) != 0 || name[0] == '\0') {
        return "freeprobe";
    }
    return name;
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config = parseArgs(argc, argv);

    if (!config.error.empty()) {
        std::cerr << "Error: " << config.error << "\n\n";
        printUsage(argv[0], std::cerr);
        return 1;
    }
    if (config.help) {
        printUsage(argv[0]);
        return 0;
    }
    if (config.version) {
        printVersion();
        return 0;
    }

    utils::LogLevel level = utils::LogLevel::INFO;
    utils::parseLogLevel(config.log_level, level);
    utils::Logger::instance().setLevel(level);
    utils::Logger::instance().setColorEnabled(::isatty(STDERR_FILENO) == 1);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const std::string credentialsDir =
        config.credentials_dir.empty() ? executableDir(argv[0]) + "/ssl" : config.credentials_dir;

    LOG_INFO("Main", "freeprobe {} starting ({})", VERSION,
             config.register_app ? "register" : (config.dry_run ? "dry-run" : "push"));
    LOG_DEBUG("Main", "Credentials: {}", credentialsDir);

    core::RunnerConfig runnerConfig;
    runnerConfig.session.app_name = APP_NAME;
    runnerConfig.session.app_version = VERSION;
    runnerConfig.session.device_name = hostName();
    runnerConfig.session.http_timeout_ms = static_cast<int>(config.http_timeout_ms);
    runnerConfig.session.poll_interval_ms = static_cast<int>(config.poll_interval_ms);
    runnerConfig.session.poll_limit = static_cast<int>(config.poll_limit);
    runnerConfig.gateway.address = config.gateway_addr;
    runnerConfig.gateway.port = config.gateway_port;
    runnerConfig.gateway.job = config.job;
    runnerConfig.gateway.timeout_ms = static_cast<int>(config.http_timeout_ms);
    runnerConfig.metrics_prefix = config.prefix;

    core::RunOptions options;
    options.register_app = config.register_app;
    options.dry_run = config.dry_run;
    options.discovery_timeout = std::chrono::milliseconds(config.discovery_timeout_ms);

    net::CurlOptions curlOptions;
    curlOptions.ca_file = config.ca_file;
    curlOptions.user_agent = std::string("freeprobe/") + VERSION;
    net::CurlHttpClient http(curlOptions);

    core::DiscoveryConfig discoveryConfig;
    discoveryConfig.uid = config.uid;
    core::DiscoveryClient discovery(discoveryConfig);

    core::CredentialStore credentials(credentialsDir);

    core::ProbeRunner runner(runnerConfig, discovery, http, credentials,
                             std::cout, std::cerr,
                             core::makeCancellableSleep(g_cancel), &g_cancel);
    int status = runner.run(options);

    LOG_INFO("Main", "freeprobe finished with status {}", status);
    return status;
}
