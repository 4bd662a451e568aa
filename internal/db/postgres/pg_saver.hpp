#pragma once

#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/async/worker_pool.hpp"
#include "internal/checkpoint/blob_codec.hpp"
#include "internal/checkpoint/latest_tuple_cache.hpp"
#include "internal/checkpoint/saver.hpp"
#include "pg_connection.hpp"

namespace waypoint::db::postgres {

struct PostgresOptions {
  // batch each write transaction through one pqxx::pipeline
  bool pipeline = false;
  // threads encoding and decoding rows
  std::size_t worker_threads = 2;
};

/*
  PostgresSaver

  Async checkpoint store over PostgreSQL with split storage: channel values
  go to checkpoint_blobs keyed by (thread_id, channel, version), so a value
  that did not change between checkpoints is written once.

  Threading:
    - one I/O loop thread owns the connection and runs every statement
    - a worker pool does serializer work (row encoding, tuple decoding)
    - loop tasks hand off to workers and back, never waiting on them

  Every operation returns a future; the blocking API throws
  UnsupportedOperation. Streams returned by AList and futures returned by
  any operation must not outlive the saver.
*/
class PostgresSaver final : public checkpoint::BaseCheckpointSaver {
 public:
  explicit PostgresSaver(std::string conninfo, PostgresOptions options = {},
                         std::shared_ptr<const serde::SerializerProtocol> serde = nullptr,
                         checkpoint::CheckpointIdPolicy id_policy = checkpoint::CheckpointIdPolicy::kPreserve);
  ~PostgresSaver() override;

  std::string_view Name() const override {
    return "PostgresSaver";
  }

  std::future<void> ASetup() override;

  std::future<std::optional<checkpoint::CheckpointTuple>> AGetTuple(const checkpoint::CheckpointConfig& config) override;

  std::unique_ptr<checkpoint::AsyncCheckpointStream> AList(const std::optional<checkpoint::CheckpointConfig>& config,
                                                           const checkpoint::ListOptions& options = {}) override;

  std::future<checkpoint::CheckpointConfig> APut(const checkpoint::CheckpointConfig& config, const checkpoint::Checkpoint& checkpoint,
                                                 const checkpoint::Metadata& metadata) override;

  std::future<void> APutWrites(const checkpoint::CheckpointConfig& config, const std::vector<checkpoint::ChannelWrite>& writes,
                               const std::string& task_id) override;

  /*
    Starts loading the latest checkpoint of config's thread in the
    background. The next AGetTuple for that thread without a checkpoint_id
    is served from it; concurrent ones join the same fetch. No-op while
    another prefetch is in flight.
  */
  void PrefetchLatest(const checkpoint::CheckpointConfig& config);

  const checkpoint::LatestTupleCache& cache() const {
    return cache_;
  }

  const PostgresOptions& options() const {
    return options_;
  }

 private:
  // Loop thread only.
  void                                         EnsureSetupOnLoop();
  std::optional<checkpoint::RawCheckpointRow>  FetchRowOnLoop(const checkpoint::CheckpointConfig& config);
  std::vector<checkpoint::RawCheckpointRow>    FetchRowsOnLoop(const std::optional<checkpoint::CheckpointConfig>& config,
                                                               const checkpoint::ListOptions& options);
  std::optional<checkpoint::ChannelVersions>   FetchVersionsOnLoop(const checkpoint::CheckpointConfig& config);
  void WriteCheckpointOnLoop(const checkpoint::CheckpointConfig& stored, const std::optional<std::string>& parent_checkpoint_id,
                             const std::string& checkpoint_json, const std::string& metadata_json,
                             const std::vector<checkpoint::BlobRow>& blobs);
  void WriteWritesOnLoop(const std::vector<checkpoint::WriteRow>& rows);

  PostgresOptions                  options_;
  checkpoint::BlobCodec            codec_;
  checkpoint::LatestTupleCache     cache_;
  std::unique_ptr<PgConnection>    conn_;
  std::mutex                       setup_mutex_;
  bool                             is_setup_ = false;
  std::unique_ptr<async::WorkerPool> cpu_;
  std::unique_ptr<async::WorkerPool> loop_;
};

} // namespace waypoint::db::postgres
