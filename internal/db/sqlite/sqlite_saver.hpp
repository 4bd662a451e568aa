#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/checkpoint/blob_codec.hpp"
#include "internal/checkpoint/saver.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace waypoint::db::sqlite {

/*
  SqliteSaver

  Blocking checkpoint store over one SQLite connection.

  Each checkpoint is one row holding the whole serialized snapshot; pending
  writes live in a separate table. Every statement sequence runs under one
  mutex and an IMMEDIATE transaction, so concurrent callers never
  interleave on the connection. The async API is not available here.
*/
class SqliteSaver final : public checkpoint::BaseCheckpointSaver {
public:
  explicit SqliteSaver(std::shared_ptr<SqliteDB> db,
                       std::shared_ptr<const serde::SerializerProtocol> serde = nullptr,
                       checkpoint::CheckpointIdPolicy id_policy = checkpoint::CheckpointIdPolicy::kPreserve);

  std::string_view Name() const override { return "SqliteSaver"; }

  void Setup() override;

  std::optional<checkpoint::CheckpointTuple> GetTuple(const checkpoint::CheckpointConfig& config) override;

  std::unique_ptr<checkpoint::CheckpointStream> List(const std::optional<checkpoint::CheckpointConfig>& config,
                                                     const checkpoint::ListOptions& options = {}) override;

  checkpoint::CheckpointConfig Put(const checkpoint::CheckpointConfig& config,
                                   const checkpoint::Checkpoint& checkpoint,
                                   const checkpoint::Metadata& metadata) override;

  void PutWrites(const checkpoint::CheckpointConfig& config,
                 const std::vector<checkpoint::ChannelWrite>& writes,
                 const std::string& task_id) override;

  SqliteDB& DB() const { return *db_; }

  // Row as stored, decoded outside the lock.
  struct StoredRow {
    std::string thread_id;
    std::string checkpoint_ns;
    std::string checkpoint_id;
    std::optional<std::string> parent_checkpoint_id;
    std::string checkpoint;
    std::string metadata;
    std::vector<checkpoint::WriteRow> writes;
  };

private:
  void SetupLocked();
  std::vector<checkpoint::WriteRow> ReadWrites(const StoredRow& row);

  std::shared_ptr<SqliteDB> db_;
  std::mutex mutex_;
  bool is_setup_ = false;
};

}
