#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/channel/base_channel.hpp"
#include "internal/serde/serializer.hpp"
#include "types.hpp"

namespace waypoint::checkpoint {

// Lazily decoded result of List().
class CheckpointStream {
 public:
  virtual ~CheckpointStream() = default;

  // nullopt once exhausted
  virtual std::optional<CheckpointTuple> Next() = 0;
};

class AsyncCheckpointStream {
 public:
  virtual ~AsyncCheckpointStream() = default;

  virtual std::future<std::optional<CheckpointTuple>> Next() = 0;
};

std::vector<CheckpointTuple> Collect(CheckpointStream& stream);
std::vector<CheckpointTuple> Collect(AsyncCheckpointStream& stream);

/*
  BaseCheckpointSaver

  Common store contract. Every operation exists in a blocking and in a
  future-returning form; a backend overrides exactly one family and the
  other throws UnsupportedOperation pointing at the backend that has it.

  GetTuple without checkpoint_id returns the latest checkpoint of the
  thread. List yields newest first. Put is an upsert keyed by
  (thread_id, checkpoint_ns, id) and returns the config of the stored
  checkpoint. PutWrites is insert-if-absent per (task_id, idx).
  Setup is idempotent and implied by every other operation.
*/
class BaseCheckpointSaver {
 public:
  BaseCheckpointSaver(std::shared_ptr<const serde::SerializerProtocol> serde, CheckpointIdPolicy id_policy);
  virtual ~BaseCheckpointSaver() = default;

  BaseCheckpointSaver(const BaseCheckpointSaver&)            = delete;
  BaseCheckpointSaver& operator=(const BaseCheckpointSaver&) = delete;

  virtual std::string_view Name() const = 0;

  virtual void                              Setup();
  virtual std::optional<CheckpointTuple>    GetTuple(const CheckpointConfig& config);
  virtual std::unique_ptr<CheckpointStream> List(const std::optional<CheckpointConfig>& config, const ListOptions& options = {});
  virtual CheckpointConfig Put(const CheckpointConfig& config, const Checkpoint& checkpoint, const Metadata& metadata);
  virtual void PutWrites(const CheckpointConfig& config, const std::vector<ChannelWrite>& writes, const std::string& task_id);

  virtual std::future<void>                           ASetup();
  virtual std::future<std::optional<CheckpointTuple>> AGetTuple(const CheckpointConfig& config);
  virtual std::unique_ptr<AsyncCheckpointStream> AList(const std::optional<CheckpointConfig>& config, const ListOptions& options = {});
  virtual std::future<CheckpointConfig> APut(const CheckpointConfig& config, const Checkpoint& checkpoint, const Metadata& metadata);
  virtual std::future<void> APutWrites(const CheckpointConfig& config, const std::vector<ChannelWrite>& writes, const std::string& task_id);

  std::optional<Checkpoint>              Get(const CheckpointConfig& config);
  std::future<std::optional<Checkpoint>> AGet(const CheckpointConfig& config);

  // Same result for every serializer: the oracle hashes canonical wire bytes.
  std::string GetNextVersion(const std::optional<std::string>& current, const channel::BaseChannel& channel) const;

  const serde::SerializerProtocol& serde() const {
    return *serde_;
  }

  CheckpointIdPolicy id_policy() const {
    return id_policy_;
  }

 protected:
  [[noreturn]] void ThrowSyncUnsupported(std::string_view operation) const;
  [[noreturn]] void ThrowAsyncUnsupported(std::string_view operation) const;

  std::shared_ptr<const serde::SerializerProtocol> serde_;
  CheckpointIdPolicy                               id_policy_;
};

// Throws util::InvalidArgument unless thread_id is set.
void RequireThread(const CheckpointConfig& config);

} // namespace waypoint::checkpoint
