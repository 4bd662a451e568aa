#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <google/protobuf/util/json_util.h>

#include "internal/checkpoint/blob_codec.hpp"
#include "internal/serde/legacy_compat_serializer.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"

namespace {

using waypoint::checkpoint::BlobCodec;
using waypoint::checkpoint::Checkpoint;
using waypoint::checkpoint::CheckpointConfig;
using waypoint::checkpoint::ChannelVersions;
using waypoint::checkpoint::RawCheckpointRow;
using waypoint::checkpoint::Value;

const std::string kV1 = "00000000000000000000000000000001.aaa";
const std::string kV2 = "00000000000000000000000000000002.bbb";

Value Str(const std::string& s) {
  Value v;
  v.set_string_value(s);
  return v;
}

BlobCodec MakeCodec() {
  return BlobCodec(std::make_shared<waypoint::serde::LegacyCompatSerializer>());
}

bool Equal(const google::protobuf::Message& a, const google::protobuf::Message& b) {
  return waypoint::serde::CanonicalBytes(a) == waypoint::serde::CanonicalBytes(b);
}

Checkpoint SampleCheckpoint() {
  Checkpoint checkpoint;
  checkpoint.set_v(1);
  checkpoint.set_id("1ef4f797-8335-6428-8001-8a1503f9b875");
  checkpoint.set_ts("2024-07-31T20:14:19.804150+00:00");
  (*checkpoint.mutable_channel_values())["answer"] = Str("42");
  (*checkpoint.mutable_channel_versions())["answer"] = kV1;
  (*checkpoint.mutable_channel_versions())["scratch"] = kV1;
  auto* send = checkpoint.add_pending_sends();
  send->set_node("worker");
  *send->mutable_arg() = Str("job");
  return checkpoint;
}

void TestAllVersionedChannelsWithoutPrevious() {
  auto       codec      = MakeCodec();
  const auto checkpoint = SampleCheckpoint();

  auto rows = codec.DumpBlobs("t1", checkpoint.channel_values(), checkpoint.channel_versions(), nullptr);
  assert(rows.size() == 2);

  assert(rows[0].channel == "answer");
  assert(rows[0].thread_id == "t1");
  assert(rows[0].version == kV1);
  assert(rows[0].type == "json");
  assert(rows[0].blob && *rows[0].blob == "\"42\"");

  // versioned but valueless: marker row without payload
  assert(rows[1].channel == "scratch");
  assert(rows[1].type == "empty");
  assert(!rows[1].blob);

  waypoint::checkpoint::ChannelValues values;
  codec.LoadBlobs(rows, &values);
  assert(values.size() == 1);
  assert(values.at("answer").string_value() == "42");
}

void TestUnchangedVersionsAreSkipped() {
  auto codec = MakeCodec();

  ChannelVersions previous;
  previous["answer"]  = kV1;
  previous["scratch"] = kV1;

  auto checkpoint = SampleCheckpoint();
  auto rows       = codec.DumpBlobs("t1", checkpoint.channel_values(), checkpoint.channel_versions(), &previous);
  assert(rows.empty());

  (*checkpoint.mutable_channel_versions())["answer"] = kV2;
  (*checkpoint.mutable_channel_values())["answer"]   = Str("43");
  (*checkpoint.mutable_channel_versions())["fresh"]  = kV1;
  (*checkpoint.mutable_channel_values())["fresh"]    = Str("new");

  rows = codec.DumpBlobs("t1", checkpoint.channel_values(), checkpoint.channel_versions(), &previous);
  assert(rows.size() == 2);
  assert(rows[0].channel == "answer" && rows[0].version == kV2);
  assert(rows[1].channel == "fresh" && rows[1].version == kV1);
}

void TestCheckpointRowStripsValuesAndWrapsSends() {
  auto       codec      = MakeCodec();
  const auto checkpoint = SampleCheckpoint();

  const auto json = codec.DumpCheckpoint(checkpoint);
  assert(json.find("channel_values") == std::string::npos);

  google::protobuf::Struct document;
  assert(google::protobuf::util::JsonStringToMessage(json, &document).ok());
  const auto& sends = document.fields().at("pending_sends").list_value();
  assert(sends.values_size() == 2);
  assert(sends.values(0).string_value() == "json");
  assert(!sends.values(1).string_value().empty());
  assert(document.fields().at("channel_versions").struct_value().fields().at("answer").string_value() == kV1);

  auto loaded   = codec.LoadCheckpoint(json);
  auto expected = checkpoint;
  expected.clear_channel_values();
  assert(Equal(loaded, expected));
}

void TestStructuredSendsAreStillAccepted() {
  auto codec      = MakeCodec();
  auto checkpoint = SampleCheckpoint();
  checkpoint.clear_channel_values();

  // rows written before sends were wrapped carry them as a plain JSON list
  waypoint::serde::JsonPlusSerializer serde;
  auto                                loaded = codec.LoadCheckpoint(serde.Dumps(checkpoint));
  assert(Equal(loaded, checkpoint));
  assert(loaded.pending_sends_size() == 1);
  assert(loaded.pending_sends(0).node() == "worker");
}

void TestWritesKeepPosition() {
  auto             codec = MakeCodec();
  CheckpointConfig config;
  config.thread_id     = "t1";
  config.checkpoint_ns = "inner";

  auto rows = codec.DumpWrites(config, "cp-1", "task-a", {{"x", Str("1")}, {"y", Str("2")}, {"x", Str("3")}});
  assert(rows.size() == 3);
  for (int i = 0; i < 3; ++i) {
    assert(rows[i].idx == i);
    assert(rows[i].task_id == "task-a");
    assert(rows[i].checkpoint_id == "cp-1");
    assert(rows[i].checkpoint_ns == "inner");
  }

  auto writes = codec.LoadWrites(rows);
  assert(writes.size() == 3);
  assert(writes[2].channel == "x" && writes[2].value.string_value() == "3");
}

void TestDecodeRowJoinsAggregates() {
  auto codec = MakeCodec();

  RawCheckpointRow row;
  row.thread_id            = "t1";
  row.checkpoint_ns        = "";
  row.checkpoint_id        = "cp-2";
  row.parent_checkpoint_id = "cp-1";
  row.checkpoint           = codec.DumpCheckpoint(SampleCheckpoint());
  row.metadata             = R"({"source": "loop", "step": 3})";
  row.blobs  = R"([["answer", "json", ")" + waypoint::util::Base64Encode("\"42\"") + R"("], ["scratch", "empty", null]])";
  row.writes = R"([["task-a", "out", "json", ")" + waypoint::util::Base64Encode("\"done\"") + R"("]])";

  auto tuple = codec.DecodeRow(row);
  assert(tuple.config.thread_id == "t1");
  assert(tuple.config.checkpoint_id == std::optional<std::string>("cp-2"));
  assert(tuple.parent_config && tuple.parent_config->checkpoint_id == std::optional<std::string>("cp-1"));
  assert(tuple.checkpoint.channel_values().size() == 1);
  assert(tuple.checkpoint.channel_values().at("answer").string_value() == "42");
  assert(tuple.checkpoint.pending_sends_size() == 1);
  assert(tuple.metadata.fields().at("step").number_value() == 3);
  assert(tuple.pending_writes.size() == 1);
  assert(tuple.pending_writes[0].task_id == "task-a");
  assert(tuple.pending_writes[0].value.string_value() == "done");

  row.parent_checkpoint_id.reset();
  row.blobs.reset();
  row.writes = "null";
  tuple      = codec.DecodeRow(row);
  assert(!tuple.parent_config);
  assert(tuple.checkpoint.channel_values().empty());
  assert(tuple.pending_writes.empty());
}

void TestMalformedAggregatesFail() {
  bool threw = false;
  try {
    (void)waypoint::checkpoint::ParseWriteAggregate(R"([["only", "three", "items"]])");
  } catch (const waypoint::util::SerializationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)waypoint::checkpoint::ParseBlobAggregate("t1", R"({"not": "a list"})");
  } catch (const waypoint::util::SerializationError&) {
    threw = true;
  }
  assert(threw);
}

void TestVersionsJson() {
  auto versions = waypoint::checkpoint::ParseVersionsJson(R"({"answer": ")" + kV1 + R"(", "scratch": ")" + kV2 + R"("})");
  assert(versions.size() == 2);
  assert(versions.at("scratch") == kV2);
  assert(waypoint::checkpoint::ParseVersionsJson("{}").empty());
}

} // namespace

int main() {
  TestAllVersionedChannelsWithoutPrevious();
  TestUnchangedVersionsAreSkipped();
  TestCheckpointRowStripsValuesAndWrapsSends();
  TestStructuredSendsAreStillAccepted();
  TestWritesKeepPosition();
  TestDecodeRowJoinsAggregates();
  TestMalformedAggregatesFail();
  TestVersionsJson();

  std::cout << "waypoint_unit_blob_codec: pass\n";
  return 0;
}
