#pragma once

#include <string>

#include <google/protobuf/message.h>

namespace waypoint::serde {

/*
  Serialized value envelope.

  Every stored value is (type, bytes); the type selects the decoder.
  "empty" is reserved for stores: it marks a channel that has a version but
  no value and never decodes to a value (a present null is a value).
*/
struct TypedBlob {
  std::string type;
  std::string data;
};

inline constexpr const char* kJsonType   = "json";
inline constexpr const char* kProtoType  = "proto";
inline constexpr const char* kLegacyType = "legacy";
inline constexpr const char* kEmptyType  = "empty";

class SerializerProtocol {
 public:
  virtual ~SerializerProtocol() = default;

  // Untyped encoding used for whole rows (checkpoint, metadata).
  virtual std::string Dumps(const google::protobuf::Message& message) const = 0;
  virtual void        Loads(const std::string& data, google::protobuf::Message* message) const = 0;

  // Typed encoding used for individual values (blobs, writes).
  virtual TypedBlob DumpsTyped(const google::protobuf::Message& message) const = 0;
  virtual void      LoadsTyped(const TypedBlob& blob, google::protobuf::Message* message) const = 0;
};

// Deterministic wire bytes (map entries sorted). Used for content hashing.
std::string CanonicalBytes(const google::protobuf::Message& message);

} // namespace waypoint::serde
