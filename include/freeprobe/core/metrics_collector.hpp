/**
 * @file metrics_collector.hpp
 * @brief Turns device counter endpoints into MetricSamples.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#include "freeprobe/core/device_session.hpp"
#include "freeprobe/core/export.hpp"
#include "freeprobe/core/metric_sample.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace google {
namespace protobuf {
class Value;
}  // namespace protobuf
}  // namespace google

namespace freeprobe {
namespace core {

/// Default metric name prefix.
constexpr const char* DEFAULT_METRICS_PREFIX = "freebox_";

/**
 * @struct Endpoint
 * @brief An authenticated GET and the category its counters are named under.
 */
struct FREEPROBE_CORE_API Endpoint {
    std::string path;           ///< Relative to the API base ("/connection/")
    std::string category;       ///< Name component ("wan")
};

/// /connection/ (wan), /system/ (system), /connection/xdsl/ (xdsl), /connection/ftth/ (ftth)
FREEPROBE_CORE_API std::vector<Endpoint> defaultEndpoints();

/**
 * @struct CollectResult
 * @brief Samples from the endpoints that answered, and the ones that did not.
 */
struct FREEPROBE_CORE_API CollectResult {
    std::vector<MetricSample> samples;
    int partialFailures = 0;
    std::vector<std::string> failedEndpoints;
};

/**
 * @brief Flatten one counter result into samples named `base`_<key>...
 *
 * Object keys are visited in sorted order and joined with '_'. Numbers
 * pass through, booleans become 1/0, strings and nulls are skipped.
 * Arrays of objects with a numeric "value" give one sample per element,
 * labelled with the element's "id" and "name", or with its "index" when
 * it has neither.
 */
FREEPROBE_CORE_API void flattenCounters(const std::string& base,
                                        const google::protobuf::Value& value,
                                        std::chrono::system_clock::time_point timestamp,
                                        std::vector<MetricSample>& out);

/**
 * @brief Reduce an arbitrary key to [a-zA-Z0-9_], as metric names require.
 */
FREEPROBE_CORE_API std::string sanitizeMetricName(const std::string& name);

/**
 * @class MetricsCollector
 * @brief Polls a fixed set of endpoints through an authenticated API.
 *
 * Endpoint failures are logged and counted, never thrown. AuthError is
 * propagated since no further endpoint can succeed.
 */
class FREEPROBE_CORE_API MetricsCollector {
public:
    explicit MetricsCollector(std::vector<Endpoint> endpoints = defaultEndpoints(),
                              std::string prefix = DEFAULT_METRICS_PREFIX);

    CollectResult collect(AuthenticatedApi& api) const;

    const std::vector<Endpoint>& endpoints() const { return endpoints_; }
    const std::string& prefix() const { return prefix_; }

private:
    std::vector<Endpoint> endpoints_;
    std::string prefix_;

    std::vector<MetricSample> collectEndpoint(AuthenticatedApi& api,
                                              const Endpoint& endpoint) const;
};

}  // namespace core
}  // namespace freeprobe
