#include "saver.hpp"

#include "internal/util/errors.hpp"
#include "version_oracle.hpp"

namespace waypoint::checkpoint {

std::vector<CheckpointTuple> Collect(CheckpointStream& stream) {
  std::vector<CheckpointTuple> out;
  while (auto tuple = stream.Next()) {
    out.push_back(std::move(*tuple));
  }
  return out;
}

std::vector<CheckpointTuple> Collect(AsyncCheckpointStream& stream) {
  std::vector<CheckpointTuple> out;
  while (auto tuple = stream.Next().get()) {
    out.push_back(std::move(*tuple));
  }
  return out;
}

void RequireThread(const CheckpointConfig& config) {
  if (config.thread_id.empty()) {
    throw util::InvalidArgument("checkpoint config requires a thread_id");
  }
}

BaseCheckpointSaver::BaseCheckpointSaver(std::shared_ptr<const serde::SerializerProtocol> serde, CheckpointIdPolicy id_policy)
    : serde_(std::move(serde)), id_policy_(id_policy) {
  if (!serde_) {
    throw util::InvalidArgument("checkpoint saver requires a serializer");
  }
}

void BaseCheckpointSaver::ThrowSyncUnsupported(std::string_view operation) const {
  throw util::UnsupportedOperation(std::string(Name()) + " does not support synchronous " + std::string(operation) +
                                   "; use the A-prefixed async methods, or SqliteSaver for blocking access");
}

void BaseCheckpointSaver::ThrowAsyncUnsupported(std::string_view operation) const {
  throw util::UnsupportedOperation(std::string(Name()) + " does not support asynchronous " + std::string(operation) +
                                   "; use the blocking methods, or PostgresSaver for async access");
}

void BaseCheckpointSaver::Setup() {
  ThrowSyncUnsupported("Setup");
}

std::optional<CheckpointTuple> BaseCheckpointSaver::GetTuple(const CheckpointConfig&) {
  ThrowSyncUnsupported("GetTuple");
}

std::unique_ptr<CheckpointStream> BaseCheckpointSaver::List(const std::optional<CheckpointConfig>&, const ListOptions&) {
  ThrowSyncUnsupported("List");
}

CheckpointConfig BaseCheckpointSaver::Put(const CheckpointConfig&, const Checkpoint&, const Metadata&) {
  ThrowSyncUnsupported("Put");
}

void BaseCheckpointSaver::PutWrites(const CheckpointConfig&, const std::vector<ChannelWrite>&, const std::string&) {
  ThrowSyncUnsupported("PutWrites");
}

std::future<void> BaseCheckpointSaver::ASetup() {
  ThrowAsyncUnsupported("ASetup");
}

std::future<std::optional<CheckpointTuple>> BaseCheckpointSaver::AGetTuple(const CheckpointConfig&) {
  ThrowAsyncUnsupported("AGetTuple");
}

std::unique_ptr<AsyncCheckpointStream> BaseCheckpointSaver::AList(const std::optional<CheckpointConfig>&, const ListOptions&) {
  ThrowAsyncUnsupported("AList");
}

std::future<CheckpointConfig> BaseCheckpointSaver::APut(const CheckpointConfig&, const Checkpoint&, const Metadata&) {
  ThrowAsyncUnsupported("APut");
}

std::future<void> BaseCheckpointSaver::APutWrites(const CheckpointConfig&, const std::vector<ChannelWrite>&, const std::string&) {
  ThrowAsyncUnsupported("APutWrites");
}

std::optional<Checkpoint> BaseCheckpointSaver::Get(const CheckpointConfig& config) {
  auto tuple = GetTuple(config);
  if (!tuple) return std::nullopt;
  return std::move(tuple->checkpoint);
}

std::future<std::optional<Checkpoint>> BaseCheckpointSaver::AGet(const CheckpointConfig& config) {
  auto pending = AGetTuple(config);
  return std::async(std::launch::deferred, [pending = std::move(pending)]() mutable -> std::optional<Checkpoint> {
    auto tuple = pending.get();
    if (!tuple) return std::nullopt;
    return std::move(tuple->checkpoint);
  });
}

std::string BaseCheckpointSaver::GetNextVersion(const std::optional<std::string>& current, const channel::BaseChannel& channel) const {
  return NextVersion(current, channel);
}

} // namespace waypoint::checkpoint
