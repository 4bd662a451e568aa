#pragma once

#include <map>
#include <optional>
#include <string>

#include "internal/channel/base_channel.hpp"
#include "types.hpp"

namespace waypoint::checkpoint {

inline constexpr int kCheckpointFormatVersion = 1;

// Lexicographically sortable, time-ordered id.
std::string NewCheckpointId();

Checkpoint EmptyCheckpoint();

Checkpoint CopyCheckpoint(const Checkpoint& checkpoint);

/*
  Snapshot of the given channels on top of the previous checkpoint.

  Versions, versions_seen and pending sends are carried over; channel values
  are rebuilt from the channels, and channels that raise EmptyChannelError
  are omitted.
*/
Checkpoint CreateCheckpoint(const Checkpoint&                                      previous,
                            const std::map<std::string, const channel::BaseChannel*>& channels,
                            const std::optional<std::string>&                      id = std::nullopt);

// Id the store persists a checkpoint under.
std::string ResolveCheckpointId(const Checkpoint& checkpoint, CheckpointIdPolicy policy);

// config.metadata, then run_id, then the caller's metadata; later keys win.
Metadata MergeMetadata(const CheckpointConfig& config, const Metadata& metadata);

} // namespace waypoint::checkpoint
