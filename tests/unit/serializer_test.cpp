#include <cassert>
#include <iostream>
#include <string>

#include "internal/serde/json_plus_serializer.hpp"
#include "internal/serde/legacy_compat_serializer.hpp"
#include "internal/util/errors.hpp"
#include "waypoint/v1.hpp"

namespace {

using waypoint::serde::JsonPlusSerializer;
using waypoint::serde::LegacyCompatSerializer;
using waypoint::serde::TypedBlob;
using waypoint::v1::Checkpoint;
using waypoint::v1::CheckpointMetadata;
using waypoint::v1::Value;

Value Str(const std::string& s) {
  Value v;
  v.set_string_value(s);
  return v;
}

Checkpoint SampleCheckpoint() {
  Checkpoint checkpoint;
  checkpoint.set_v(1);
  checkpoint.set_id("1ef4f797-8335-6428-8001-8a1503f9b875");
  checkpoint.set_ts("2024-07-31T20:14:19.804150+00:00");
  (*checkpoint.mutable_channel_values())["my_key"] = Str("meow");
  (*checkpoint.mutable_channel_versions())["my_key"] = "00000000000000000000000000000001.abc";
  (*(*checkpoint.mutable_versions_seen())["node"].mutable_versions())["my_key"] = "00000000000000000000000000000001.abc";
  auto* send = checkpoint.add_pending_sends();
  send->set_node("node");
  *send->mutable_arg() = Str("payload");
  return checkpoint;
}

bool Equal(const google::protobuf::Message& a, const google::protobuf::Message& b) {
  return waypoint::serde::CanonicalBytes(a) == waypoint::serde::CanonicalBytes(b);
}

template <typename Fn>
bool ThrowsSerialization(Fn&& fn) {
  try {
    fn();
  } catch (const waypoint::util::SerializationError&) {
    return true;
  }
  return false;
}

void TestUntypedRoundTripUsesFieldNames() {
  JsonPlusSerializer serde;
  const auto         checkpoint = SampleCheckpoint();

  const auto json = serde.Dumps(checkpoint);
  assert(json.find("\"channel_values\"") != std::string::npos);
  assert(json.find("\"pending_sends\"") != std::string::npos);

  Checkpoint loaded;
  serde.Loads(json, &loaded);
  assert(Equal(loaded, checkpoint));
}

void TestUnknownJsonFieldsAreIgnored() {
  JsonPlusSerializer serde;
  Checkpoint         loaded;
  serde.Loads(R"({"v": 1, "id": "abc", "written_by_a_newer_version": true})", &loaded);
  assert(loaded.id() == "abc");
}

void TestTypedEncodings() {
  JsonPlusSerializer json;
  JsonPlusSerializer binary(true);
  const auto         value = Str("meow");

  const auto as_json = json.DumpsTyped(value);
  assert(as_json.type == "json");
  assert(as_json.data == "\"meow\"");

  const auto as_proto = binary.DumpsTyped(value);
  assert(as_proto.type == "proto");

  // either instance reads both encodings
  Value a;
  Value b;
  binary.LoadsTyped(as_json, &a);
  json.LoadsTyped(as_proto, &b);
  assert(a.string_value() == "meow");
  assert(b.string_value() == "meow");

  Value null_value;
  null_value.set_null_value(google::protobuf::NULL_VALUE);
  Value loaded;
  json.LoadsTyped(json.DumpsTyped(null_value), &loaded);
  assert(loaded.kind_case() == Value::kNullValue);
}

void TestEmptyAndUnknownTypesFail() {
  JsonPlusSerializer serde;
  Value              value;
  assert(ThrowsSerialization([&] { serde.LoadsTyped({"empty", ""}, &value); }));
  assert(ThrowsSerialization([&] { serde.LoadsTyped({"msgpack", "\x81"}, &value); }));
  assert(ThrowsSerialization([&] { serde.LoadsTyped({"legacy", "\x80\x02."}, &value); }));
  assert(ThrowsSerialization([&] { serde.LoadsTyped({"json", "{not json"}, &value); }));
  assert(ThrowsSerialization([&] { serde.LoadsTyped({"proto", "\xff\xff\xff"}, &value); }));
}

void TestLegacyFramesAreReadable() {
  LegacyCompatSerializer serde;
  const auto             checkpoint = SampleCheckpoint();

  const auto frame = waypoint::serde::EncodeLegacyFrame(checkpoint);
  assert(waypoint::serde::IsLegacyFrame(frame));
  assert(!waypoint::serde::IsLegacyFrame(serde.Dumps(checkpoint)));

  Checkpoint loaded;
  serde.Loads(frame, &loaded);
  assert(Equal(loaded, checkpoint));

  Value typed;
  serde.LoadsTyped({"legacy", waypoint::serde::EncodeLegacyFrame(Str("old"))}, &typed);
  assert(typed.string_value() == "old");

  // current encodings still go through the JSON path
  Checkpoint current;
  serde.Loads(serde.Dumps(checkpoint), &current);
  assert(Equal(current, checkpoint));

  // writes never produce the legacy encoding
  assert(serde.DumpsTyped(Str("new")).type == "json");
}

void TestCorruptLegacyFrameFails() {
  LegacyCompatSerializer serde;
  Checkpoint             loaded;
  const std::string      corrupt = std::string("\x80\x02", 2) + "\xff\xff" + ".";
  assert(ThrowsSerialization([&] { serde.Loads(corrupt, &loaded); }));
}

void TestMetadataStruct() {
  JsonPlusSerializer serde;
  CheckpointMetadata metadata;
  (*metadata.mutable_fields())["source"] = Str("input");
  (*metadata.mutable_fields())["step"].set_number_value(1);

  CheckpointMetadata loaded;
  serde.Loads(serde.Dumps(metadata), &loaded);
  assert(loaded.fields().at("source").string_value() == "input");
  assert(loaded.fields().at("step").number_value() == 1);
}

} // namespace

int main() {
  TestUntypedRoundTripUsesFieldNames();
  TestUnknownJsonFieldsAreIgnored();
  TestTypedEncodings();
  TestEmptyAndUnknownTypesFail();
  TestLegacyFramesAreReadable();
  TestCorruptLegacyFrameFails();
  TestMetadataStruct();

  std::cout << "waypoint_unit_serializer: pass\n";
  return 0;
}
