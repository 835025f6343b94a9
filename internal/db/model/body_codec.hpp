#pragma once

#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>

#include <string>

namespace rollout::db::model {

/*
  Record bodies are stored as protobuf JSON (TEXT in SQLite, JSONB in
  Postgres) so rows stay inspectable with plain SQL.
*/
inline bool EncodeBody(const google::protobuf::Message& message, std::string* out) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  return google::protobuf::util::MessageToJsonString(message, out, options).ok();
}

inline bool DecodeBody(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  return google::protobuf::util::JsonStringToMessage(json, message, options).ok();
}

} // namespace rollout::db::model
