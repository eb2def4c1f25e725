/**
 * @file json_mapping.cpp
 * @brief JSON mapping on top of google::protobuf::util.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#include "freeprobe/core/json_mapping.hpp"
#include "freeprobe/utils/logger.hpp"

#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>

namespace freeprobe {
namespace core {

bool fromJson(const std::string& json, google::protobuf::Message& message, std::string* error) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    message.Clear();
    auto status = google::protobuf::util::JsonStringToMessage(json, &message, options);
    if (!status.ok()) {
        if (error) {
            *error = status.ToString();
        }
        return false;
    }
    return true;
}

std::string toJson(const google::protobuf::Message& message, bool pretty) {
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;
    options.add_whitespace = pretty;

    std::string out;
    auto status = google::protobuf::util::MessageToJsonString(message, &out, options);
    if (!status.ok()) {
        LOG_ERROR("Json", "Failed to serialize {}: {}", message.GetTypeName(), status.ToString());
        return std::string();
    }
    return out;
}

}  // namespace core
}  // namespace freeprobe
