#pragma once

#include <string>

#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace coord::util {

/*
  Protobuf JSON mapping for every persisted record and every CLI payload.
*/

inline std::string ToJson(const google::protobuf::Message& message, bool pretty = true) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = pretty;
  options.preserve_proto_field_names    = false;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw CoordError(ErrorKind::kUnknown, "json encode " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

// Unknown fields are rejected. Parse failures surface as ValidationFailed.
inline void ParseJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw ValidationFailed("invalid " + message->GetTypeName() + ": " + std::string(status.message()));
  }
}

template <typename Message>
Message ParseJsonAs(const std::string& json) {
  Message message;
  ParseJson(json, &message);
  return message;
}

} // namespace coord::util
