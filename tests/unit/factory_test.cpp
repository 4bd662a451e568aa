#include <cassert>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/channel/last_value.hpp"
#include "internal/checkpoint/version_oracle.hpp"
#include "internal/factory.hpp"

namespace {

using waypoint::runtime::config::RuntimeConfig;

void TestDefaultsToInMemorySqlite() {
  RuntimeConfig config;
  auto          saver = waypoint::factory::BuildSaver(config);
  assert(saver->Name() == "SqliteSaver");
  assert(saver->id_policy() == waypoint::checkpoint::CheckpointIdPolicy::kPreserve);

  waypoint::checkpoint::CheckpointConfig thread;
  thread.thread_id = "factory";
  assert(!saver->GetTuple(thread));
}

void TestIdPolicyAndSerializer() {
  RuntimeConfig config;
  config.mutable_checkpoint()->set_id_policy(waypoint::runtime::config::CHECKPOINT_ID_POLICY_ALWAYS_NEW);
  config.mutable_serde()->set_binary(true);

  assert(waypoint::factory::BuildIdPolicy(config) == waypoint::checkpoint::CheckpointIdPolicy::kAlwaysNew);

  auto serde = waypoint::factory::BuildSerializer(config);
  google::protobuf::Value value;
  value.set_string_value("x");
  assert(serde->DumpsTyped(value).type == "proto");
}

void TestNextVersionIgnoresSerializer() {
  RuntimeConfig json_config;
  RuntimeConfig binary_config;
  binary_config.mutable_serde()->set_binary(true);
  auto json_saver   = waypoint::factory::BuildSaver(json_config);
  auto binary_saver = waypoint::factory::BuildSaver(binary_config);

  google::protobuf::Value value;
  value.set_string_value("x");
  waypoint::channel::LastValue channel;
  channel.Update({value});

  const auto expected = waypoint::checkpoint::NextVersion(std::nullopt, channel);
  assert(json_saver->GetNextVersion(std::nullopt, channel) == expected);
  assert(binary_saver->GetNextVersion(std::nullopt, channel) == expected);
  assert(binary_saver->GetNextVersion(expected, channel) == waypoint::checkpoint::NextVersion(expected, channel));
}

void TestPostgresNeedsUri() {
  RuntimeConfig config;
  config.mutable_database()->mutable_postgres();

  bool threw = false;
  try {
    (void)waypoint::factory::BuildSaver(config);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  RuntimeConfig config;
  config.mutable_logging()->set_level("warn");
  waypoint::factory::InitializeRuntime(config);

  TestDefaultsToInMemorySqlite();
  TestIdPolicyAndSerializer();
  TestNextVersionIgnoresSerializer();
  TestPostgresNeedsUri();

  waypoint::factory::ShutdownRuntime();
  std::cout << "waypoint_unit_factory: pass\n";
  return 0;
}
