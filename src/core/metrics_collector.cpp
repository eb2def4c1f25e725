/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#include "freeprobe/core/metrics_collector.hpp"
#include "freeprobe/core/errors.hpp"
#include "freeprobe/core/json_mapping.hpp"
#include "freeprobe/utils/logger.hpp"

#include "freebox_api.pb.h"

#include <google/protobuf/struct.pb.h>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace freeprobe {
namespace core {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

std::string labelText(const Value& value) {
    switch (value.kind_case()) {
        case Value::kStringValue:
            return value.string_value();
        case Value::kNumberValue: {
            double v = value.number_value();
            if (std::isfinite(v) && v == std::floor(v) && std::fabs(v) < 9.007199254740992e15) {
                return std::to_string(static_cast<long long>(v));
            }
            std::ostringstream oss;
            oss << v;
            return oss.str();
        }
        case Value::kBoolValue:
            return value.bool_value() ? "true" : "false";
        default:
            return std::string();
    }
}

std::vector<std::string> sortedKeys(const Struct& object) {
    std::vector<std::string> keys;
    keys.reserve(static_cast<size_t>(object.fields().size()));
    for (const auto& field : object.fields()) {
        keys.push_back(field.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

void flattenList(const std::string& name, const google::protobuf::ListValue& list,
                 std::chrono::system_clock::time_point timestamp,
                 std::vector<MetricSample>& out) {
    for (int i = 0; i < list.values_size(); ++i) {
        const Value& element = list.values(i);
        if (element.kind_case() != Value::kStructValue) {
            continue;
        }
        const auto& fields = element.struct_value().fields();
        auto valueIt = fields.find("value");
        if (valueIt == fields.end() || valueIt->second.kind_case() != Value::kNumberValue) {
            continue;
        }

        MetricSample sample;
        sample.name = name;
        sample.value = valueIt->second.number_value();
        sample.timestamp = timestamp;
        for (const char* label : {"id", "name"}) {
            auto it = fields.find(label);
            if (it != fields.end()) {
                std::string text = labelText(it->second);
                if (!text.empty()) {
                    sample.labels[label] = text;
                }
            }
        }
        // Keeps label-less elements distinct series
        if (sample.labels.empty()) {
            sample.labels["index"] = std::to_string(i);
        }
        out.push_back(std::move(sample));
    }
}

}  // namespace

std::vector<Endpoint> defaultEndpoints() {
    return {
        {"/connection/", "wan"},
        {"/system/", "system"},
        {"/connection/xdsl/", "xdsl"},
        {"/connection/ftth/", "ftth"},
    };
}

std::string sanitizeMetricName(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_';
        out.push_back(ok ? static_cast<char>(c) : '_');
    }
    return out;
}

void flattenCounters(const std::string& base, const Value& value,
                     std::chrono::system_clock::time_point timestamp,
                     std::vector<MetricSample>& out) {
    switch (value.kind_case()) {
        case Value::kNumberValue: {
            MetricSample sample;
            sample.name = base;
            sample.value = value.number_value();
            sample.timestamp = timestamp;
            out.push_back(std::move(sample));
            break;
        }
        case Value::kBoolValue: {
            MetricSample sample;
            sample.name = base;
            sample.value = value.bool_value() ? 1.0 : 0.0;
            sample.timestamp = timestamp;
            out.push_back(std::move(sample));
            break;
        }
        case Value::kStructValue: {
            const Struct& object = value.struct_value();
            for (const auto& key : sortedKeys(object)) {
                flattenCounters(base + "_" + sanitizeMetricName(key),
                                object.fields().at(key), timestamp, out);
            }
            break;
        }
        case Value::kListValue:
            flattenList(base, value.list_value(), timestamp, out);
            break;
        default:
            // strings, nulls: not a measurement
            break;
    }
}

// =============================================================================
// MetricsCollector
// =============================================================================

MetricsCollector::MetricsCollector(std::vector<Endpoint> endpoints, std::string prefix)
    : endpoints_(std::move(endpoints))
    , prefix_(std::move(prefix))
{
}

std::vector<MetricSample> MetricsCollector::collectEndpoint(AuthenticatedApi& api,
                                                            const Endpoint& endpoint) const {
    std::string body = api.authenticatedGet(endpoint.path);
    auto timestamp = std::chrono::system_clock::now();

    api::CounterResponse response;
    std::string error;
    if (!fromJson(body, response, &error)) {
        throw CollectError(endpoint.path + ": malformed counters (" + error + ")");
    }
    if (!response.success()) {
        throw CollectError(endpoint.path + ": request refused");
    }

    std::vector<MetricSample> samples;
    flattenCounters(prefix_ + sanitizeMetricName(endpoint.category), response.result(),
                    timestamp, samples);
    return samples;
}

CollectResult MetricsCollector::collect(AuthenticatedApi& api) const {
    CollectResult result;

    for (const auto& endpoint : endpoints_) {
        try {
            std::vector<MetricSample> samples = collectEndpoint(api, endpoint);
            LOG_DEBUG("Collector", "{}: {} samples", endpoint.path, samples.size());
            result.samples.insert(result.samples.end(),
                                  std::make_move_iterator(samples.begin()),
                                  std::make_move_iterator(samples.end()));
        } catch (const CollectError& e) {
            LOG_WARN("Collector", "Skipping {}: {}", endpoint.path, e.what());
            result.partialFailures++;
            result.failedEndpoints.push_back(endpoint.path);
        }
    }

    LOG_INFO("Collector", "Collected {} samples from {}/{} endpoints", result.samples.size(),
             endpoints_.size() - result.failedEndpoints.size(), endpoints_.size());
    return result;
}

}  // namespace core
}  // namespace freeprobe
