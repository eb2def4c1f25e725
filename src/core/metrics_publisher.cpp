/**
 * @file metrics_publisher.cpp
 * @brief MetricsPublisher implementation.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#include "freeprobe/core/metrics_publisher.hpp"
#include "freeprobe/core/errors.hpp"
#include "freeprobe/core/exposition.hpp"
#include "freeprobe/utils/logger.hpp"
#include "freeprobe/utils/string_utils.hpp"

#include <algorithm>

namespace freeprobe {
namespace core {

MetricsPublisher::MetricsPublisher(net::HttpClient& http, GatewayConfig config, std::ostream& out)
    : http_(http)
    , config_(std::move(config))
    , out_(out)
{
}

std::string MetricsPublisher::gatewayUrl() const {
    return "http://" + config_.address + ":" + std::to_string(config_.port) +
           "/metrics/job/" + utils::url_encode(config_.job);
}

void MetricsPublisher::publish(const std::vector<MetricSample>& samples, PublishMode mode) {
    const std::string payload = serializeSamples(samples);

    if (mode == PublishMode::DRY_RUN) {
        out_ << payload;
        out_.flush();
        LOG_DEBUG("Publisher", "Printed {} samples", samples.size());
        return;
    }

    const std::string url = gatewayUrl();
    LOG_INFO("Publisher", "Pushing {} samples to {}", samples.size(), url);

    net::HttpResult result = http_.put(url, payload, EXPOSITION_CONTENT_TYPE, config_.timeout_ms);
    if (result.status_code == 0) {
        throw PublishError("Push gateway " + config_.address + ":" +
                           std::to_string(config_.port) + " unreachable: " + result.error);
    }
    if (!result.ok) {
        std::string detail = utils::trim(result.body);
        std::replace(detail.begin(), detail.end(), '\n', ' ');
        if (detail.size() > 200) {
            detail = detail.substr(0, 200) + "...";
        }
        throw PublishError("Push gateway rejected metrics: HTTP " +
                               std::to_string(result.status_code) +
                               (detail.empty() ? std::string() : " (" + detail + ")"),
                           result.status_code);
    }

    LOG_DEBUG("Publisher", "Gateway answered HTTP {}", result.status_code);
}

}  // namespace core
}  // namespace freeprobe
