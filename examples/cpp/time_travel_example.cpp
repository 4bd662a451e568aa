#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/channel/channel_registry.hpp"
#include "internal/channel/last_value.hpp"
#include "internal/checkpoint/checkpoint.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

namespace {

using waypoint::checkpoint::BaseCheckpointSaver;
using waypoint::checkpoint::Checkpoint;
using waypoint::checkpoint::CheckpointConfig;
using waypoint::checkpoint::CheckpointTuple;
using waypoint::checkpoint::Metadata;

google::protobuf::Value Text(const std::string& s) {
  google::protobuf::Value v;
  v.set_string_value(s);
  return v;
}

// Blocking view over whichever API family the backend implements.
class Store {
 public:
  explicit Store(BaseCheckpointSaver& saver) : saver_(saver), async_(saver.Name() == "PostgresSaver") {
  }

  CheckpointConfig Put(const CheckpointConfig& config, const Checkpoint& checkpoint, const Metadata& metadata) {
    return async_ ? saver_.APut(config, checkpoint, metadata).get() : saver_.Put(config, checkpoint, metadata);
  }

  std::optional<CheckpointTuple> Get(const CheckpointConfig& config) {
    return async_ ? saver_.AGetTuple(config).get() : saver_.GetTuple(config);
  }

  std::vector<CheckpointTuple> History(const CheckpointConfig& config) {
    if (async_) {
      auto stream = saver_.AList(config);
      return waypoint::checkpoint::Collect(*stream);
    }
    auto stream = saver_.List(config);
    return waypoint::checkpoint::Collect(*stream);
  }

 private:
  BaseCheckpointSaver& saver_;
  bool                 async_;
};

std::string Bump(BaseCheckpointSaver& saver, const Checkpoint& checkpoint, const std::string& channel,
                 const waypoint::channel::BaseChannel& state) {
  std::optional<std::string> current;
  auto                       it = checkpoint.channel_versions().find(channel);
  if (it != checkpoint.channel_versions().end()) current = it->second;
  return saver.GetNextVersion(current, state);
}

} // namespace

int main(int argc, char** argv) {
  try {
    // Without a config file the store is an in-memory SQLite database.
    auto config = argc > 1 ? waypoint::config::ConfigLoader::LoadFromYaml(argv[1]) : waypoint::runtime::config::RuntimeConfig();
    waypoint::factory::InitializeRuntime(config);

    auto  saver = waypoint::factory::BuildSaver(config);
    Store store(*saver);
    if (saver->Name() == "PostgresSaver") {
      saver->ASetup().get();
    } else {
      saver->Setup();
    }

    auto topic = waypoint::channel::ChannelRegistry::Instance().Create(std::string(waypoint::channel::LastValue::kKind));

    CheckpointConfig head;
    head.thread_id = "example-" + waypoint::checkpoint::NewCheckpointId();
    head.run_id    = "example-run";

    Checkpoint checkpoint = waypoint::checkpoint::EmptyCheckpoint();
    int        step       = 0;
    for (const char* value : {"draft", "review", "published"}) {
      topic->Update({Text(value)});
      (*checkpoint.mutable_channel_versions())["topic"] = Bump(*saver, checkpoint, "topic", *topic);
      checkpoint = waypoint::checkpoint::CreateCheckpoint(checkpoint, {{"topic", topic.get()}});

      Metadata metadata;
      (*metadata.mutable_fields())["step"].set_number_value(step++);
      head = store.Put(head, checkpoint, metadata);
    }

    auto history = store.History(head);
    for (const auto& tuple : history) {
      std::cout << *tuple.config.checkpoint_id << " step=" << tuple.metadata.fields().at("step").number_value()
                << " topic=" << tuple.checkpoint.channel_values().at("topic").string_value() << '\n';
    }

    // Rewind to the first checkpoint and fork a new branch from it.
    auto first = store.Get(history.back().config);
    if (!first) {
      throw std::runtime_error("first checkpoint disappeared");
    }
    auto restored = topic->FromCheckpoint(first->checkpoint.channel_values().at("topic"));
    std::cout << "restored topic: " << restored->Get().string_value() << '\n';

    restored->Update({Text("rewritten")});
    auto fork = first->checkpoint;
    (*fork.mutable_channel_versions())["topic"] = Bump(*saver, fork, "topic", *restored);
    fork = waypoint::checkpoint::CreateCheckpoint(fork, {{"topic", restored.get()}});

    auto branch = store.Put(first->config, fork, {});
    auto tuple  = store.Get(branch);
    if (!tuple) {
      throw std::runtime_error("forked checkpoint not found");
    }
    std::cout << "fork " << *branch.checkpoint_id << " parent=" << *tuple->parent_config->checkpoint_id
              << " topic=" << tuple->checkpoint.channel_values().at("topic").string_value() << '\n';

    saver.reset();
    waypoint::factory::ShutdownRuntime();
  } catch (const std::exception& e) {
    WAYPOINT_LOG_ERROR("example failed", {waypoint::observability::StringField("error", e.what())});
    waypoint::factory::ShutdownRuntime();
    return 1;
  }
  return 0;
}
