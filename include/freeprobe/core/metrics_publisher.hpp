/**
 * @file metrics_publisher.hpp
 * @brief Pushes samples to a Prometheus push gateway, or prints them.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#include "freeprobe/core/export.hpp"
#include "freeprobe/core/metric_sample.hpp"
#include "freeprobe/net/http_client.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace freeprobe {
namespace core {

enum class PublishMode {
    LIVE,       ///< PUT to the gateway
    DRY_RUN     ///< Write the payload to the output stream
};

/**
 * @struct GatewayConfig
 * @brief Push gateway location and grouping.
 */
struct FREEPROBE_CORE_API GatewayConfig {
    std::string address = "prometheus.catsnet.home";
    uint16_t port = 9091;
    std::string job = "freeprobe";
    int timeout_ms = net::DEFAULT_HTTP_TIMEOUT_MS;
};

/**
 * @class MetricsPublisher
 * @brief Serializes samples in the text exposition format and delivers them.
 *
 * A live push replaces every metric of the job's group on the gateway.
 */
class FREEPROBE_CORE_API MetricsPublisher {
public:
    MetricsPublisher(net::HttpClient& http, GatewayConfig config, std::ostream& out);

    /// http://{address}:{port}/metrics/job/{job}
    std::string gatewayUrl() const;

    /**
     * @throws PublishError if the gateway is unreachable or answers non-2xx.
     */
    void publish(const std::vector<MetricSample>& samples, PublishMode mode);

private:
    net::HttpClient& http_;
    GatewayConfig config_;
    std::ostream& out_;
};

}  // namespace core
}  // namespace freeprobe
