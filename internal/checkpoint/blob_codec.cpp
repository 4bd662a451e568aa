#include "blob_codec.hpp"

#include <algorithm>

#include <google/protobuf/util/json_util.h>

#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"
#include "version_oracle.hpp"

namespace waypoint::checkpoint {

namespace {

constexpr const char* kPendingSendsField = "pending_sends";

bool IsString(const google::protobuf::Value& value) {
  return value.kind_case() == google::protobuf::Value::kStringValue;
}

bool IsKnownType(const std::string& type) {
  return type == serde::kJsonType || type == serde::kProtoType || type == serde::kLegacyType;
}

const google::protobuf::ListValue& ParseAggregate(const std::string& json, google::protobuf::Value* holder) {
  auto status = google::protobuf::util::JsonStringToMessage(json, holder);
  if (!status.ok()) {
    throw util::SerializationError("malformed row aggregate: " + std::string(status.message()));
  }
  if (holder->kind_case() == google::protobuf::Value::kNullValue) {
    holder->mutable_list_value();
  }
  if (holder->kind_case() != google::protobuf::Value::kListValue) {
    throw util::SerializationError("row aggregate is not a JSON array");
  }
  return holder->list_value();
}

std::string StringAt(const google::protobuf::ListValue& entry, int index) {
  const auto& value = entry.values(index);
  if (!IsString(value)) {
    throw util::SerializationError("row aggregate entry " + std::to_string(index) + " is not a string");
  }
  return value.string_value();
}

} // namespace

std::vector<BlobRow> ParseBlobAggregate(const std::string& thread_id, const std::string& json) {
  google::protobuf::Value holder;
  const auto&             list = ParseAggregate(json, &holder);

  std::vector<BlobRow> rows;
  rows.reserve(list.values_size());
  for (const auto& item : list.values()) {
    if (!item.has_list_value() || item.list_value().values_size() != 3) {
      throw util::SerializationError("blob aggregate entry must be [channel, type, blob]");
    }
    const auto& entry = item.list_value();

    BlobRow row;
    row.thread_id = thread_id;
    row.channel   = StringAt(entry, 0);
    row.type      = StringAt(entry, 1);
    if (IsString(entry.values(2))) {
      row.blob = util::Base64Decode(entry.values(2).string_value());
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

std::vector<WriteRow> ParseWriteAggregate(const std::string& json) {
  google::protobuf::Value holder;
  const auto&             list = ParseAggregate(json, &holder);

  std::vector<WriteRow> rows;
  rows.reserve(list.values_size());
  for (const auto& item : list.values()) {
    if (!item.has_list_value() || item.list_value().values_size() != 4) {
      throw util::SerializationError("write aggregate entry must be [task_id, channel, type, blob]");
    }
    const auto& entry = item.list_value();

    WriteRow row;
    row.task_id = StringAt(entry, 0);
    row.channel = StringAt(entry, 1);
    row.type    = StringAt(entry, 2);
    row.blob    = util::Base64Decode(StringAt(entry, 3));
    row.idx     = static_cast<int>(rows.size());
    rows.push_back(std::move(row));
  }
  return rows;
}

ChannelVersions ParseVersionsJson(const std::string& json) {
  google::protobuf::Struct document;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &document);
  if (!status.ok()) {
    throw util::SerializationError("malformed channel versions: " + std::string(status.message()));
  }

  ChannelVersions versions;
  for (const auto& entry : document.fields()) {
    if (!IsString(entry.second)) {
      throw util::SerializationError("channel version of " + entry.first + " is not a string");
    }
    versions[entry.first] = entry.second.string_value();
  }
  return versions;
}

BlobCodec::BlobCodec(std::shared_ptr<const serde::SerializerProtocol> serde) : serde_(std::move(serde)) {
}

std::vector<BlobRow> BlobCodec::DumpBlobs(const std::string& thread_id, const ChannelValues& values, const ChannelVersions& versions,
                                          const ChannelVersions* previous_versions) const {
  std::vector<std::string> channels;
  channels.reserve(versions.size());
  for (const auto& entry : versions) channels.push_back(entry.first);
  std::sort(channels.begin(), channels.end());

  std::vector<BlobRow> rows;
  for (const auto& channel : channels) {
    const auto& version = versions.at(channel);

    if (previous_versions) {
      auto prev = previous_versions->find(channel);
      if (prev != previous_versions->end() && !VersionGreater(version, prev->second)) {
        continue;
      }
    }

    BlobRow row;
    row.thread_id = thread_id;
    row.channel   = channel;
    row.version   = version;

    auto value = values.find(channel);
    if (value == values.end()) {
      row.type = serde::kEmptyType;
    } else {
      auto typed = serde_->DumpsTyped(value->second);
      row.type   = std::move(typed.type);
      row.blob   = std::move(typed.data);
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

void BlobCodec::LoadBlobs(const std::vector<BlobRow>& rows, ChannelValues* values) const {
  for (const auto& row : rows) {
    if (row.type == serde::kEmptyType || !row.blob) {
      continue;
    }
    Value value;
    serde_->LoadsTyped({row.type, *row.blob}, &value);
    (*values)[row.channel] = std::move(value);
  }
}

std::vector<WriteRow> BlobCodec::DumpWrites(const CheckpointConfig& config, const std::string& checkpoint_id, const std::string& task_id,
                                            const std::vector<ChannelWrite>& writes) const {
  std::vector<WriteRow> rows;
  rows.reserve(writes.size());
  for (std::size_t idx = 0; idx < writes.size(); ++idx) {
    auto typed = serde_->DumpsTyped(writes[idx].second);

    WriteRow row;
    row.thread_id     = config.thread_id;
    row.checkpoint_ns = config.checkpoint_ns;
    row.checkpoint_id = checkpoint_id;
    row.task_id       = task_id;
    row.idx           = static_cast<int>(idx);
    row.channel       = writes[idx].first;
    row.type          = std::move(typed.type);
    row.blob          = std::move(typed.data);
    rows.push_back(std::move(row));
  }
  return rows;
}

std::vector<PendingWrite> BlobCodec::LoadWrites(const std::vector<WriteRow>& rows) const {
  std::vector<PendingWrite> writes;
  writes.reserve(rows.size());
  for (const auto& row : rows) {
    PendingWrite write;
    write.task_id = row.task_id;
    write.channel = row.channel;
    serde_->LoadsTyped({row.type, row.blob}, &write.value);
    writes.push_back(std::move(write));
  }
  return writes;
}

std::string BlobCodec::DumpCheckpoint(const Checkpoint& checkpoint) const {
  Checkpoint header = checkpoint;
  header.clear_channel_values();

  ::waypoint::v1::PendingSends sends;
  sends.mutable_sends()->Swap(header.mutable_pending_sends());

  google::protobuf::Struct document;
  serde_->Loads(serde_->Dumps(header), &document);

  auto typed = serde_->DumpsTyped(sends);
  auto* pair = (*document.mutable_fields())[kPendingSendsField].mutable_list_value();
  pair->add_values()->set_string_value(typed.type);
  pair->add_values()->set_string_value(util::Base64Encode(typed.data));

  return serde_->Dumps(document);
}

Checkpoint BlobCodec::LoadCheckpoint(const std::string& json) const {
  google::protobuf::Struct document;
  serde_->Loads(json, &document);

  ::waypoint::v1::PendingSends sends;
  auto&            fields = *document.mutable_fields();
  auto             it     = fields.find(kPendingSendsField);
  if (it != fields.end() && it->second.has_list_value()) {
    const auto& list    = it->second.list_value();
    const bool  is_pair = list.values_size() == 2 && IsString(list.values(0)) && IsString(list.values(1)) &&
                         IsKnownType(list.values(0).string_value());
    if (is_pair) {
      serde_->LoadsTyped({list.values(0).string_value(), util::Base64Decode(list.values(1).string_value())}, &sends);
      fields.erase(it);
    }
  }

  Checkpoint checkpoint;
  serde_->Loads(serde_->Dumps(document), &checkpoint);
  for (auto& send : *sends.mutable_sends()) {
    *checkpoint.add_pending_sends() = std::move(send);
  }
  return checkpoint;
}

std::string BlobCodec::DumpMetadata(const Metadata& metadata) const {
  return serde_->Dumps(metadata);
}

Metadata BlobCodec::LoadMetadata(const std::string& json) const {
  Metadata metadata;
  if (!json.empty()) {
    serde_->Loads(json, &metadata);
  }
  return metadata;
}

CheckpointTuple BlobCodec::DecodeRow(const RawCheckpointRow& row) const {
  CheckpointTuple tuple;
  tuple.config.thread_id     = row.thread_id;
  tuple.config.checkpoint_ns = row.checkpoint_ns;
  tuple.config.checkpoint_id = row.checkpoint_id;

  tuple.checkpoint = LoadCheckpoint(row.checkpoint);
  if (row.blobs) {
    LoadBlobs(ParseBlobAggregate(row.thread_id, *row.blobs), tuple.checkpoint.mutable_channel_values());
  }
  tuple.metadata = LoadMetadata(row.metadata);

  if (row.parent_checkpoint_id) {
    CheckpointConfig parent;
    parent.thread_id     = row.thread_id;
    parent.checkpoint_ns = row.checkpoint_ns;
    parent.checkpoint_id = row.parent_checkpoint_id;
    tuple.parent_config  = std::move(parent);
  }

  if (row.writes) {
    tuple.pending_writes = LoadWrites(ParseWriteAggregate(*row.writes));
  }
  return tuple;
}

} // namespace waypoint::checkpoint
