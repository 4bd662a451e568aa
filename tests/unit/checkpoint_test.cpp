#include <cassert>
#include <iostream>
#include <map>
#include <string>
#include <type_traits>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/channel/last_value.hpp"
#include "internal/channel/untracked_value.hpp"
#include "internal/checkpoint/checkpoint.hpp"

namespace {

using namespace waypoint::checkpoint;

// the store types resolve to the re-exported model, not the generated package
static_assert(std::is_same_v<Checkpoint, waypoint::v1::Checkpoint>);
static_assert(std::is_same_v<Metadata, google::protobuf::Struct>);
static_assert(std::is_same_v<Value, google::protobuf::Value>);

Value Str(const std::string& s) {
  Value v;
  v.set_string_value(s);
  return v;
}

void TestIdsSortByCreation() {
  std::string previous = NewCheckpointId();
  for (int i = 0; i < 500; ++i) {
    auto id = NewCheckpointId();
    assert(id > previous);
    previous = id;
  }
}

void TestEmptyCheckpoint() {
  auto checkpoint = EmptyCheckpoint();
  assert(checkpoint.v() == kCheckpointFormatVersion);
  assert(!checkpoint.id().empty());
  assert(!checkpoint.ts().empty());
  assert(checkpoint.channel_values().empty());
  assert(checkpoint.channel_versions().empty());
  assert(checkpoint.pending_sends_size() == 0);
}

void TestCreateCheckpointSnapshotsChannels() {
  auto previous = EmptyCheckpoint();
  (*previous.mutable_channel_values())["gone"]     = Str("old");
  (*previous.mutable_channel_versions())["answer"] = "1.a";
  (*(*previous.mutable_versions_seen())["node"].mutable_versions())["answer"] = "1.a";

  waypoint::channel::LastValue answer;
  answer.Update({Str("42")});
  waypoint::channel::LastValue      unset;
  waypoint::channel::UntrackedValue scratch;
  scratch.Update({Str("temp")});

  std::map<std::string, const waypoint::channel::BaseChannel*> channels = {
      {"answer", &answer},
      {"unset", &unset},
      {"scratch", &scratch},
  };

  auto checkpoint = CreateCheckpoint(previous, channels, std::string("cp-explicit"));
  assert(checkpoint.id() == "cp-explicit");
  assert(checkpoint.channel_values().size() == 1);
  assert(checkpoint.channel_values().at("answer").string_value() == "42");
  assert(checkpoint.channel_versions().at("answer") == "1.a");
  assert(checkpoint.versions_seen().at("node").versions().at("answer") == "1.a");

  // previous is untouched
  assert(previous.channel_values().count("gone") == 1);

  auto generated = CreateCheckpoint(previous, channels);
  assert(!generated.id().empty() && generated.id() != previous.id());
}

void TestResolveCheckpointId() {
  Checkpoint checkpoint;
  checkpoint.set_id("cp-1");
  assert(ResolveCheckpointId(checkpoint, CheckpointIdPolicy::kPreserve) == "cp-1");

  auto fresh = ResolveCheckpointId(checkpoint, CheckpointIdPolicy::kAlwaysNew);
  assert(fresh != "cp-1" && fresh.size() == 36);

  checkpoint.clear_id();
  assert(!ResolveCheckpointId(checkpoint, CheckpointIdPolicy::kPreserve).empty());
}

void TestMergeMetadata() {
  CheckpointConfig config;
  config.thread_id = "t1";
  config.run_id    = "run-7";
  (*config.metadata.mutable_fields())["source"] = Str("config");
  (*config.metadata.mutable_fields())["step"].set_number_value(1);

  Metadata metadata;
  (*metadata.mutable_fields())["step"].set_number_value(2);
  (*metadata.mutable_fields())["writes"] = Str("none");

  auto merged = MergeMetadata(config, metadata);
  assert(merged.fields().size() == 4);
  assert(merged.fields().at("source").string_value() == "config");
  assert(merged.fields().at("run_id").string_value() == "run-7");
  assert(merged.fields().at("step").number_value() == 2);
  assert(merged.fields().at("writes").string_value() == "none");

  (*metadata.mutable_fields())["run_id"] = Str("explicit");
  assert(MergeMetadata(config, metadata).fields().at("run_id").string_value() == "explicit");

  config.run_id.reset();
  assert(MergeMetadata(config, {}).fields().count("run_id") == 0);
}

void TestRecordTypesUseTheDataModel() {
  CheckpointTuple tuple;
  tuple.config.thread_id = "t";
  (*tuple.metadata.mutable_fields())["step"].set_number_value(1);
  tuple.pending_writes.push_back({"task", "out", Str("w")});

  ChannelWrite write{"out", Str("w")};
  assert(write.second.string_value() == tuple.pending_writes[0].value.string_value());

  ListOptions options;
  options.filter = tuple.metadata;
  assert(options.filter->fields().at("step").number_value() == 1);
}

} // namespace

int main() {
  TestIdsSortByCreation();
  TestEmptyCheckpoint();
  TestCreateCheckpointSnapshotsChannels();
  TestResolveCheckpointId();
  TestMergeMetadata();
  TestRecordTypesUseTheDataModel();

  std::cout << "waypoint_unit_checkpoint: pass\n";
  return 0;
}
