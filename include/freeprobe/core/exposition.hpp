/**
 * @file exposition.hpp
 * @brief Prometheus text exposition format (0.0.4), write and read.
 *
 * One sample per line:
 * @code
 * freebox_wan_rate_down 12345
 * freebox_system_sensors{id="temp_cpum",name="Température CPU M"} 62
 * @endcode
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#include "freeprobe/core/export.hpp"
#include "freeprobe/core/metric_sample.hpp"

#include <string>
#include <vector>

namespace freeprobe {
namespace core {

/// Content-Type of the text format.
constexpr const char* EXPOSITION_CONTENT_TYPE = "text/plain; version=0.0.4";

/**
 * @brief Text that parses back to exactly the same double ("NaN", "+Inf", "-Inf" for specials).
 */
FREEPROBE_CORE_API std::string formatSampleValue(double value);

/**
 * @brief Escape backslash, double quote and newline in a label value.
 */
FREEPROBE_CORE_API std::string escapeLabelValue(const std::string& value);

/**
 * @brief Render samples, one line each, in the given order.
 */
FREEPROBE_CORE_API std::string serializeSamples(const std::vector<MetricSample>& samples);

/**
 * @brief Parse exposition text back into samples (timestamps are not restored).
 *
 * Blank lines and '#' comments are skipped.
 * @param error Receives "line N: reason" when false.
 */
FREEPROBE_CORE_API bool parseSamples(const std::string& text, std::vector<MetricSample>& out,
                                     std::string* error = nullptr);

}  // namespace core
}  // namespace freeprobe
