#include "legacy_compat_serializer.hpp"

#include "internal/util/errors.hpp"

namespace waypoint::serde {

namespace {
constexpr char kFrameStart    = '\x80';
constexpr char kFrameProtocol = '\x02';
constexpr char kFrameStop     = '.';
} // namespace

bool IsLegacyFrame(const std::string& data) {
  return data.size() >= 3 && data.front() == kFrameStart && data.back() == kFrameStop;
}

void DecodeLegacyFrame(const std::string& data, google::protobuf::Message* message) {
  if (!IsLegacyFrame(data)) {
    throw util::SerializationError("not a legacy binary frame");
  }
  if (!message->ParseFromArray(data.data() + 2, static_cast<int>(data.size() - 3))) {
    throw util::SerializationError("corrupt legacy payload for " + message->GetTypeName());
  }
}

std::string EncodeLegacyFrame(const google::protobuf::Message& message) {
  std::string out;
  out.push_back(kFrameStart);
  out.push_back(kFrameProtocol);
  out += CanonicalBytes(message);
  out.push_back(kFrameStop);
  return out;
}

void LegacyCompatSerializer::Loads(const std::string& data, google::protobuf::Message* message) const {
  if (IsLegacyFrame(data)) {
    DecodeLegacyFrame(data, message);
    return;
  }
  JsonPlusSerializer::Loads(data, message);
}

void LegacyCompatSerializer::LoadsTyped(const TypedBlob& blob, google::protobuf::Message* message) const {
  if (blob.type == kLegacyType) {
    DecodeLegacyFrame(blob.data, message);
    return;
  }
  JsonPlusSerializer::LoadsTyped(blob, message);
}

} // namespace waypoint::serde
