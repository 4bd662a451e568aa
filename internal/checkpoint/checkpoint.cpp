#include "checkpoint.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace waypoint::checkpoint {

std::string NewCheckpointId() {
  return util::ToString(util::GenerateTimeOrderedUUID());
}

Checkpoint EmptyCheckpoint() {
  Checkpoint checkpoint;
  checkpoint.set_v(kCheckpointFormatVersion);
  checkpoint.set_id(NewCheckpointId());
  checkpoint.set_ts(util::ToIso8601(util::Now()));
  return checkpoint;
}

Checkpoint CopyCheckpoint(const Checkpoint& checkpoint) {
  return Checkpoint(checkpoint);
}

Checkpoint CreateCheckpoint(const Checkpoint&                                      previous,
                            const std::map<std::string, const channel::BaseChannel*>& channels,
                            const std::optional<std::string>&                      id) {
  Checkpoint checkpoint = CopyCheckpoint(previous);
  checkpoint.set_v(kCheckpointFormatVersion);
  checkpoint.set_id(id ? *id : NewCheckpointId());
  checkpoint.set_ts(util::ToIso8601(util::Now()));

  auto* values = checkpoint.mutable_channel_values();
  values->clear();
  for (const auto& [name, channel] : channels) {
    try {
      (*values)[name] = channel->Checkpoint();
    } catch (const util::EmptyChannelError&) {
      // no value, nothing to snapshot
    }
  }
  return checkpoint;
}

std::string ResolveCheckpointId(const Checkpoint& checkpoint, CheckpointIdPolicy policy) {
  if (policy == CheckpointIdPolicy::kAlwaysNew || checkpoint.id().empty()) {
    return NewCheckpointId();
  }
  return checkpoint.id();
}

Metadata MergeMetadata(const CheckpointConfig& config, const Metadata& metadata) {
  Metadata merged = config.metadata;
  auto&    fields = *merged.mutable_fields();

  if (config.run_id) {
    fields["run_id"].set_string_value(*config.run_id);
  }
  for (const auto& [key, value] : metadata.fields()) {
    fields[key] = value;
  }
  return merged;
}

} // namespace waypoint::checkpoint
