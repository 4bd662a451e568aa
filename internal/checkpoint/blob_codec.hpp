#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/map.h>

#include "internal/serde/serializer.hpp"
#include "types.hpp"

namespace waypoint::checkpoint {

using ChannelValues   = google::protobuf::Map<std::string, Value>;
using ChannelVersions = google::protobuf::Map<std::string, std::string>;

// One row of checkpoint_blobs. blob is unset for the "empty" marker.
struct BlobRow {
  std::string                thread_id;
  std::string                channel;
  std::string                version;
  std::string                type;
  std::optional<std::string> blob;
};

// One row of checkpoint_writes.
struct WriteRow {
  std::string thread_id;
  std::string checkpoint_ns;
  std::string checkpoint_id;
  std::string task_id;
  int         idx = 0;
  std::string channel;
  std::string type;
  std::string blob;
};

/*
  A checkpoints row as the split-storage SELECT returns it, before any
  decoding. Blobs and writes arrive as JSON aggregates of
  [channel, type, base64] and [task_id, channel, type, base64].
*/
struct RawCheckpointRow {
  std::string                thread_id;
  std::string                checkpoint_ns;
  std::string                checkpoint_id;
  std::optional<std::string> parent_checkpoint_id;
  std::string                checkpoint;
  std::string                metadata;
  std::optional<std::string> blobs;
  std::optional<std::string> writes;
};

/*
  BlobCodec

  Encoding side of the split storage layout: a checkpoint row without
  channel values, one blob row per (thread, channel, version) and one row
  per pending write. Pure CPU work with no database handle, so it runs on
  the worker pool.
*/
class BlobCodec {
 public:
  explicit BlobCodec(std::shared_ptr<const serde::SerializerProtocol> serde);

  /*
    Blob rows for the channels whose version advanced past previous.

    A channel whose version is not greater than its previous version
    already has its row and is skipped. A channel with a version but no
    value gets an "empty" marker row. Without previous versions every
    versioned channel is written.
  */
  std::vector<BlobRow> DumpBlobs(const std::string& thread_id, const ChannelValues& values, const ChannelVersions& versions,
                                 const ChannelVersions* previous_versions) const;

  // Decodes blob rows into channel values, dropping "empty" markers.
  void LoadBlobs(const std::vector<BlobRow>& rows, ChannelValues* values) const;

  std::vector<WriteRow> DumpWrites(const CheckpointConfig& config, const std::string& checkpoint_id, const std::string& task_id,
                                   const std::vector<ChannelWrite>& writes) const;

  std::vector<PendingWrite> LoadWrites(const std::vector<WriteRow>& rows) const;

  /*
    JSON stored in checkpoints.checkpoint.

    channel_values are stripped (they live in blobs) and pending_sends is
    replaced by a [type, base64] pair so the row stays queryable JSON.
  */
  std::string DumpCheckpoint(const Checkpoint& checkpoint) const;

  // Accepts the pair form and the older structured list of sends.
  Checkpoint LoadCheckpoint(const std::string& json) const;

  std::string DumpMetadata(const Metadata& metadata) const;
  Metadata    LoadMetadata(const std::string& json) const;

  CheckpointTuple DecodeRow(const RawCheckpointRow& row) const;

 private:
  std::shared_ptr<const serde::SerializerProtocol> serde_;
};

// Parsers for the JSON aggregates of RawCheckpointRow.
std::vector<BlobRow>  ParseBlobAggregate(const std::string& thread_id, const std::string& json);
std::vector<WriteRow> ParseWriteAggregate(const std::string& json);

// {"channel": "version", ...} as selected from checkpoint -> 'channel_versions'.
ChannelVersions ParseVersionsJson(const std::string& json);

} // namespace waypoint::checkpoint
