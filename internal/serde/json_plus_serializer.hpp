#pragma once

#include "serializer.hpp"

namespace waypoint::serde {

/*
  Default serializer.

  Untyped: protobuf JSON with proto field names, so stored rows can be
  queried with json_extract / jsonb operators.
  Typed: "json" by default, "proto" (binary wire format) when binary is set.
  Both typed encodings are always readable.
*/
class JsonPlusSerializer : public SerializerProtocol {
 public:
  explicit JsonPlusSerializer(bool binary = false);

  std::string Dumps(const google::protobuf::Message& message) const override;
  void        Loads(const std::string& data, google::protobuf::Message* message) const override;

  TypedBlob DumpsTyped(const google::protobuf::Message& message) const override;
  void      LoadsTyped(const TypedBlob& blob, google::protobuf::Message* message) const override;

 private:
  bool binary_;
};

} // namespace waypoint::serde
