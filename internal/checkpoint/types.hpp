#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "waypoint/v1.hpp"

namespace waypoint::checkpoint {

// waypoint::checkpoint::v1 is the generated proto package, so spell the
// re-export namespace out in full.
using Checkpoint = ::waypoint::v1::Checkpoint;
using Metadata   = ::waypoint::v1::CheckpointMetadata;
using Value      = ::waypoint::v1::Value;

/*
  Execution context handed in by the executor.

  thread_id is required. checkpoint_id selects a specific checkpoint on
  reads and names the parent on writes. metadata and run_id are merged into
  the persisted CheckpointMetadata.
*/
struct CheckpointConfig {
  std::string                thread_id;
  std::string                checkpoint_ns;
  std::optional<std::string> checkpoint_id;
  std::optional<std::string> run_id;
  Metadata                   metadata;
};

// One output of a task, recorded before the owning checkpoint is superseded.
struct PendingWrite {
  std::string task_id;
  std::string channel;
  Value       value;
};

// (channel, value) as emitted by a task; the position in the sequence becomes idx.
using ChannelWrite = std::pair<std::string, Value>;

struct CheckpointTuple {
  CheckpointConfig                config;
  Checkpoint                      checkpoint;
  Metadata                        metadata;
  std::optional<CheckpointConfig> parent_config;
  std::vector<PendingWrite>       pending_writes;
};

struct ListOptions {
  // subset containment over stored metadata
  std::optional<Metadata> filter;
  // only checkpoints with an id strictly below before->checkpoint_id
  std::optional<CheckpointConfig> before;
  // unset or 0 returns the full history
  std::optional<std::size_t> limit;
};

enum class CheckpointIdPolicy {
  // use the caller's id, generate one only when it is empty
  kPreserve,
  // always generate a fresh time-ordered id
  kAlwaysNew,
};

} // namespace waypoint::checkpoint
