/**
 * @file json_mapping.hpp
 * @brief JSON <-> protobuf conversion for device API payloads.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#include "freeprobe/core/export.hpp"

#include <string>

namespace google {
namespace protobuf {
class Message;
}  // namespace protobuf
}  // namespace google

namespace freeprobe {
namespace core {

/**
 * @brief Parse JSON into `message`, ignoring unknown fields.
 * @param error Receives the parser message when false.
 */
FREEPROBE_CORE_API bool fromJson(const std::string& json, google::protobuf::Message& message,
                                 std::string* error = nullptr);

/**
 * @brief Serialize with the snake_case field names the device expects.
 * @return Empty string if serialization failed.
 */
FREEPROBE_CORE_API std::string toJson(const google::protobuf::Message& message,
                                      bool pretty = false);

}  // namespace core
}  // namespace freeprobe
