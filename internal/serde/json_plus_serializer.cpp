#include "json_plus_serializer.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace waypoint::serde {

std::string CanonicalBytes(const google::protobuf::Message& message) {
  std::string out;
  {
    google::protobuf::io::StringOutputStream raw(&out);
    google::protobuf::io::CodedOutputStream  coded(&raw);
    coded.SetSerializationDeterministic(true);
    if (!message.SerializeToCodedStream(&coded)) {
      throw util::SerializationError("failed to serialize " + message.GetTypeName());
    }
  }
  return out;
}

JsonPlusSerializer::JsonPlusSerializer(bool binary) : binary_(binary) {
}

std::string JsonPlusSerializer::Dumps(const google::protobuf::Message& message) const {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw util::SerializationError("Failed to encode " + message.GetTypeName() + " as JSON: " + std::string(status.message()));
  }
  return json;
}

void JsonPlusSerializer::Loads(const std::string& data, google::protobuf::Message* message) const {
  google::protobuf::util::JsonParseOptions options;
  // rows written by newer versions may carry fields we do not know yet
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(data, message, options);
  if (!status.ok()) {
    throw util::SerializationError("Failed to decode " + message->GetTypeName() + " from JSON: " + std::string(status.message()));
  }
}

TypedBlob JsonPlusSerializer::DumpsTyped(const google::protobuf::Message& message) const {
  if (binary_) {
    std::string bytes;
    if (!message.SerializeToString(&bytes)) {
      throw util::SerializationError("failed to serialize " + message.GetTypeName());
    }
    return {kProtoType, std::move(bytes)};
  }
  return {kJsonType, Dumps(message)};
}

void JsonPlusSerializer::LoadsTyped(const TypedBlob& blob, google::protobuf::Message* message) const {
  if (blob.type == kJsonType) {
    Loads(blob.data, message);
    return;
  }
  if (blob.type == kProtoType) {
    if (!message->ParseFromString(blob.data)) {
      throw util::SerializationError("corrupt protobuf payload for " + message->GetTypeName());
    }
    return;
  }
  if (blob.type == kEmptyType) {
    throw util::SerializationError("\"empty\" blob carries no value");
  }
  throw util::SerializationError("unknown serialization type: " + blob.type);
}

} // namespace waypoint::serde
