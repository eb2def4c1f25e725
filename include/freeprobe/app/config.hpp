/**
 * @file config.hpp
 * @brief FreeProbe command line configuration
 */

#pragma once

#include "freeprobe/utils/logger.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

namespace freeprobe {
namespace app {

constexpr const char* APP_NAME = "FreeProbe";
constexpr const char* VERSION = "0.1.0";
constexpr const char* RELEASE_DATE = "2024-06-30";

/**
 * @brief Command line configuration
 */
struct Config {
    bool register_app = false;
    bool dry_run = false;
    bool version = false;
    bool help = false;
    std::string error;                          ///< Set with help when the command line is invalid

    // Discovery
    int64_t discovery_timeout_ms = 2000;
    std::string uid;                            ///< Only accept the device with this uid

    // Push gateway
    std::string gateway_addr = "prometheus.catsnet.home";
    uint16_t gateway_port = 9091;
    std::string job = "freeprobe";
    std::string prefix = "freebox_";

    // Device API
    std::string credentials_dir;                ///< Empty = <executable dir>/ssl
    std::string ca_file;
    int64_t http_timeout_ms = 10000;
    int64_t poll_interval_ms = 2000;
    int64_t poll_limit = 60;

    std::string log_level = "INFO";
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name, std::ostream& out = std::cout) {
    out << "FreeProbe - Freebox performance counters for Prometheus\n\n"
        << "Usage: " << program_name << " [OPTIONS]\n\n"
        << "Options:\n"
        << "  -r, --register            Register FreeProbe on the Freebox and exit\n"
        << "  -d, --dry-run             Print counters to stdout instead of pushing them\n"
        << "  -V, --version             Show version and exit\n"
        << "  -h, --help                Show this help message\n"
        << "\nDiscovery Options:\n"
        << "  --timeout <ms>            mDNS discovery timeout (default: 2000)\n"
        << "  --uid <uid>               Only accept the Freebox with this uid\n"
        << "\nPush Gateway Options:\n"
        << "  --gateway-addr <host>     Push gateway address (default: prometheus.catsnet.home)\n"
        << "  --gateway-port <port>     Push gateway port (default: 9091)\n"
        << "  --job <name>              Job name (default: freeprobe)\n"
        << "  --prefix <prefix>         Metric name prefix (default: freebox_)\n"
        << "\nFreebox API Options:\n"
        << "  --credentials-dir <dir>   Token directory (default: <executable dir>/ssl)\n"
        << "  --ca-file <pem>           CA bundle used to verify the Freebox certificate\n"
        << "  --http-timeout <ms>       Per request timeout (default: 10000)\n"
        << "  --poll-interval <ms>      Delay between registration polls (default: 2000)\n"
        << "  --poll-limit <n>          Maximum registration polls (default: 60)\n"
        << "\n  --log-level <level>       TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF (default: INFO)\n\n"
        << "Example:\n"
        << "  " << program_name << " --register\n"
        << "  " << program_name << " --dry-run --log-level DEBUG\n";
}

inline void printVersion(std::ostream& out = std::cout) {
    out << "freeprobe " << VERSION << " - " << RELEASE_DATE << "\n";
}

/**
 * @brief Parse a decimal integer within [min, max]
 * @return False if `text` is not entirely a number in range
 */
inline bool parseInteger(const char* text, int64_t min, int64_t max, int64_t& out) {
    if (text == nullptr || *text == '\0') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || value < min || value > max) {
        return false;
    }
    out = static_cast<int64_t>(value);
    return true;
}

/**
 * @brief Check a metric name prefix against [a-zA-Z_:][a-zA-Z0-9_:]*
 */
inline bool isValidMetricPrefix(const std::string& prefix) {
    if (prefix.empty()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        const char c = prefix[i];
        const bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        const bool digit = c >= '0' && c <= '9';
        if (!alpha && c != '_' && c != ':' && !(digit && i > 0)) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration; help and error are set on invalid input
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    auto invalid = [&config](const std::string& message) {
        config.error = message;
        config.help = true;
        return config;
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Flags
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }
        if (std::strcmp(arg, "--version") == 0 || std::strcmp(arg, "-V") == 0) {
            config.version = true;
            return config;
        }
        if (std::strcmp(arg, "--register") == 0 || std::strcmp(arg, "-r") == 0) {
            config.register_app = true;
            continue;
        }
        if (std::strcmp(arg, "--dry-run") == 0 || std::strcmp(arg, "-d") == 0) {
            config.dry_run = true;
            continue;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            return invalid(std::string("Option ") + arg + " requires a value");
        }

        const char* value = argv[++i];
        int64_t number = 0;

        if (std::strcmp(arg, "--timeout") == 0) {
            if (!parseInteger(value, 1, 600000, number)) {
                return invalid(std::string("Invalid discovery timeout: ") + value);
            }
            config.discovery_timeout_ms = number;
        } else if (std::strcmp(arg, "--uid") == 0) {
            config.uid = value;
        } else if (std::strcmp(arg, "--gateway-addr") == 0) {
            if (*value == '\0') {
                return invalid("Gateway address cannot be empty");
            }
            config.gateway_addr = value;
        } else if (std::strcmp(arg, "--gateway-port") == 0) {
            if (!parseInteger(value, 1, 65535, number)) {
                return invalid(std::string("Invalid gateway port: ") + value);
            }
            config.gateway_port = static_cast<uint16_t>(number);
        } else if (std::strcmp(arg, "--job") == 0) {
            if (*value == '\0') {
                return invalid("Job name cannot be empty");
            }
            config.job = value;
        } else if (std::strcmp(arg, "--prefix") == 0) {
            if (!isValidMetricPrefix(value)) {
                return invalid(std::string("Invalid metric prefix: ") + value);
            }
            config.prefix = value;
        } else if (std::strcmp(arg, "--credentials-dir") == 0) {
            config.credentials_dir = value;
        } else if (std::strcmp(arg, "--ca-file") == 0) {
            config.ca_file = value;
        } else if (std::strcmp(arg, "--http-timeout") == 0) {
            if (!parseInteger(value, 1, 600000, number)) {
                return invalid(std::string("Invalid HTTP timeout: ") + value);
            }
            config.http_timeout_ms = number;
        } else if (std::strcmp(arg, "--poll-interval") == 0) {
            if (!parseInteger(value, 0, 600000, number)) {
                return invalid(std::string("Invalid poll interval: ") + value);
            }
            config.poll_interval_ms = number;
        } else if (std::strcmp(arg, "--poll-limit") == 0) {
            if (!parseInteger(value, 1, 100000, number)) {
                return invalid(std::string("Invalid poll limit: ") + value);
            }
            config.poll_limit = number;
        } else if (std::strcmp(arg, "--log-level") == 0) {
            utils::LogLevel level;
            if (!utils::parseLogLevel(value, level)) {
                return invalid(std::string("Invalid log level: ") + value);
            }
            config.log_level = value;
        } else {
            return invalid(std::string("Unknown option ") + arg);
        }
    }

    return config;
}

} // namespace app
} // namespace freeprobe
