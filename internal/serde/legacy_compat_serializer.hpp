#pragma once

#include <string>

#include "json_plus_serializer.hpp"

namespace waypoint::serde {

/*
  Reads payloads written by the legacy binary scheme.

  Legacy frame: 0x80, protocol byte, protobuf wire bytes, '.'.
  Detected by the leading 0x80 and trailing '.' (no JSON document starts
  with 0x80). Writes always use the current encoding, so a legacy row is
  upgraded the next time it is written.
*/
class LegacyCompatSerializer final : public JsonPlusSerializer {
 public:
  using JsonPlusSerializer::JsonPlusSerializer;

  void Loads(const std::string& data, google::protobuf::Message* message) const override;
  void LoadsTyped(const TypedBlob& blob, google::protobuf::Message* message) const override;
};

bool        IsLegacyFrame(const std::string& data);
void        DecodeLegacyFrame(const std::string& data, google::protobuf::Message* message);
std::string EncodeLegacyFrame(const google::protobuf::Message& message);

} // namespace waypoint::serde
