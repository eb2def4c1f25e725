/**
 * @file metric_sample.hpp
 * @brief One gauge reading.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#include <chrono>
#include <map>
#include <string>

namespace freeprobe {
namespace core {

using LabelSet = std::map<std::string, std::string>;

/**
 * @struct MetricSample
 * @brief A named value with optional labels and its capture time.
 */
struct MetricSample {
    std::string name;           ///< Prefixed metric name ("freebox_wan_rate_down")
    double value = 0.0;
    LabelSet labels;
    std::chrono::system_clock::time_point timestamp;
};

}  // namespace core
}  // namespace freeprobe
