#include "pg_saver.hpp"

#include <utility>

#include "internal/checkpoint/checkpoint.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/serde/legacy_compat_serializer.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"
#include "pg_queries.hpp"
#include "pg_tx.hpp"

namespace waypoint::db::postgres {

using checkpoint::CheckpointConfig;
using checkpoint::CheckpointTuple;
using checkpoint::RawCheckpointRow;

namespace {

using TupleResult = std::optional<CheckpointTuple>;

// Runs fn; anything it throws goes to on_error.
template <typename Fn, typename OnError>
void Guarded(const Fn& fn, const OnError& on_error) {
  try {
    fn();
  } catch (...) {
    on_error(std::current_exception());
  }
}

// Queues fn on pool. A pool that was stopped reports through on_error.
template <typename Fn, typename OnError>
void PostGuarded(async::WorkerPool& pool, Fn fn, OnError on_error) {
  Guarded([&] { pool.Post([fn, on_error] { Guarded(fn, on_error); }); }, on_error);
}

template <typename T>
auto Rejecter(const std::shared_ptr<std::promise<T>>& promise) {
  return [promise](std::exception_ptr error) { promise->set_exception(error); };
}

template <typename Fn>
auto WithStorageErrors(const std::string& context, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::failure& e) {
    util::ThrowIfDbError(Translate(e), context);
    throw;
  }
}

RawCheckpointRow ReadRow(const pqxx::row& r) {
  RawCheckpointRow row;
  row.thread_id     = r[0].as<std::string>();
  row.checkpoint_ns = r[1].as<std::string>();
  row.checkpoint_id = r[2].as<std::string>();
  if (!r[3].is_null()) row.parent_checkpoint_id = r[3].as<std::string>();
  row.checkpoint = r[4].as<std::string>();
  row.metadata   = r[5].as<std::string>();
  if (!r[6].is_null()) row.blobs = r[6].as<std::string>();
  if (!r[7].is_null()) row.writes = r[7].as<std::string>();
  return row;
}

std::string QuoteOptional(pqxx::work& w, const std::optional<std::string>& value) {
  return value ? w.quote(*value) : std::string("NULL");
}

// Blob bytes travel as base64 text and are decoded into BYTEA by the statement.
std::optional<std::string> Base64Param(const std::optional<std::string>& bytes) {
  if (!bytes) return std::nullopt;
  return util::Base64Encode(*bytes);
}

std::string InsertBlobLiteral(pqxx::work& w, const checkpoint::BlobRow& blob) {
  return "INSERT INTO checkpoint_blobs (thread_id, channel, version, type, blob) VALUES (" + w.quote(blob.thread_id) + ", " +
         w.quote(blob.channel) + ", " + w.quote(blob.version) + ", " + w.quote(blob.type) + ", decode(" +
         QuoteOptional(w, Base64Param(blob.blob)) + ", 'base64')) ON CONFLICT (thread_id, channel, version) DO NOTHING";
}

std::string InsertWriteLiteral(pqxx::work& w, const checkpoint::WriteRow& write) {
  return "INSERT INTO checkpoint_writes (thread_id, checkpoint_ns, checkpoint_id, task_id, idx, channel, type, blob) VALUES (" +
         w.quote(write.thread_id) + ", " + w.quote(write.checkpoint_ns) + ", " + w.quote(write.checkpoint_id) + ", " +
         w.quote(write.task_id) + ", " + std::to_string(write.idx) + ", " + w.quote(write.channel) + ", " + w.quote(write.type) +
         ", decode(" + w.quote(util::Base64Encode(write.blob)) + ", 'base64')) "
         "ON CONFLICT (thread_id, checkpoint_ns, checkpoint_id, task_id, idx) DO NOTHING";
}

std::string UpsertCheckpointLiteral(pqxx::work& w, const CheckpointConfig& stored, const std::optional<std::string>& parent,
                                    const std::string& checkpoint_json, const std::string& metadata_json) {
  return "INSERT INTO checkpoints (thread_id, checkpoint_ns, checkpoint_id, parent_checkpoint_id, checkpoint, metadata) VALUES (" +
         w.quote(stored.thread_id) + ", " + w.quote(stored.checkpoint_ns) + ", " + w.quote(*stored.checkpoint_id) + ", " +
         QuoteOptional(w, parent) + ", " + w.quote(checkpoint_json) + "::jsonb, " + w.quote(metadata_json) +
         "::jsonb) ON CONFLICT (thread_id, checkpoint_ns, checkpoint_id) DO UPDATE SET "
         "parent_checkpoint_id = COALESCE(EXCLUDED.parent_checkpoint_id, checkpoints.parent_checkpoint_id), "
         "checkpoint = EXCLUDED.checkpoint, metadata = EXCLUDED.metadata";
}

// Runs every statement through one pipeline and surfaces the first failure.
void RunPipelined(pqxx::work& w, const std::vector<std::string>& statements) {
  pqxx::pipeline                       pipe(w);
  std::vector<pqxx::pipeline::query_id> ids;
  ids.reserve(statements.size());
  for (const auto& sql : statements) {
    ids.push_back(pipe.insert(sql));
  }
  for (const auto id : ids) {
    pipe.retrieve(id);
  }
  pipe.complete();
}

/*
  Rows are fetched in one scan on the loop; each Next() decodes one of them
  on the worker pool.
*/
class PgCheckpointStream final : public checkpoint::AsyncCheckpointStream {
 public:
  PgCheckpointStream(std::shared_future<std::vector<RawCheckpointRow>> rows, const checkpoint::BlobCodec& codec,
                     async::WorkerPool& workers)
      : rows_(std::move(rows)), codec_(codec), workers_(workers) {
  }

  std::future<TupleResult> Next() override {
    const std::size_t index = next_++;
    auto              rows  = rows_;
    const auto*       codec = &codec_;
    return workers_.Submit([rows, index, codec]() -> TupleResult {
      const auto& all = rows.get();
      if (index >= all.size()) return std::nullopt;
      return codec->DecodeRow(all[index]);
    });
  }

 private:
  std::shared_future<std::vector<RawCheckpointRow>> rows_;
  const checkpoint::BlobCodec&                       codec_;
  async::WorkerPool&                                 workers_;
  std::size_t                                        next_ = 0;
};

} // namespace

PostgresSaver::PostgresSaver(std::string conninfo, PostgresOptions options, std::shared_ptr<const serde::SerializerProtocol> serde,
                             checkpoint::CheckpointIdPolicy id_policy)
    : BaseCheckpointSaver(serde ? std::move(serde) : std::make_shared<serde::LegacyCompatSerializer>(), id_policy),
      options_(options),
      codec_(serde_) {
  if (options_.worker_threads == 0) {
    throw util::InvalidArgument("PostgresSaver requires at least one worker thread");
  }
  conn_ = WithStorageErrors("connect", [&] { return std::make_unique<PgConnection>(std::move(conninfo)); });
  cpu_  = std::make_unique<async::WorkerPool>("pg-codec", options_.worker_threads);
  loop_ = std::make_unique<async::WorkerPool>("pg-loop", 1);

  WAYPOINT_LOG_INFO("postgres saver started", {observability::BoolField("pipeline", options_.pipeline),
                                               observability::IntField("worker_threads", static_cast<std::int64_t>(options_.worker_threads))});
}

PostgresSaver::~PostgresSaver() {
  // the loop drains first so its hand-offs still reach live workers
  loop_->Stop();
  cpu_->Stop();
}

void PostgresSaver::EnsureSetupOnLoop() {
  std::lock_guard lock(setup_mutex_);
  if (is_setup_) return;

  WithStorageErrors("setup", [&] {
    PgTransaction tx(conn_->Get(), "setup");
    for (const char* sql : kSchema) {
      tx.Work().exec(sql);
    }
    tx.Commit();
    conn_->PrepareStatements();
  });
  is_setup_ = true;
  WAYPOINT_LOG_INFO("postgres checkpoint schema ready");
}

std::future<void> PostgresSaver::ASetup() {
  auto promise = std::make_shared<std::promise<void>>();
  auto future  = promise->get_future();
  PostGuarded(
      *loop_,
      [this, promise] {
        EnsureSetupOnLoop();
        promise->set_value();
      },
      Rejecter(promise));
  return future;
}

std::optional<RawCheckpointRow> PostgresSaver::FetchRowOnLoop(const CheckpointConfig& config) {
  return WithStorageErrors("get checkpoint", [&]() -> std::optional<RawCheckpointRow> {
    PgTransaction tx(conn_->Get(), "get_tuple");
    auto          result = config.checkpoint_id
                               ? tx.Work().exec_prepared("select_by_id", config.thread_id, config.checkpoint_ns, *config.checkpoint_id)
                               : tx.Work().exec_prepared("select_latest", config.thread_id, config.checkpoint_ns);
    tx.Commit();
    if (result.empty()) return std::nullopt;
    return ReadRow(result[0]);
  });
}

std::vector<RawCheckpointRow> PostgresSaver::FetchRowsOnLoop(const std::optional<CheckpointConfig>& config,
                                                             const checkpoint::ListOptions& options) {
  return WithStorageErrors("list checkpoints", [&] {
    PgTransaction tx(conn_->Get(), "list");
    auto&         w = tx.Work();

    std::string sql = std::string(kSelectCheckpoint) + " WHERE TRUE";
    if (config) {
      sql += " AND c.thread_id = " + w.quote(config->thread_id) + " AND c.checkpoint_ns = " + w.quote(config->checkpoint_ns);
      if (config->checkpoint_id) {
        sql += " AND c.checkpoint_id = " + w.quote(*config->checkpoint_id);
      }
    }
    if (options.filter) {
      sql += " AND c.metadata @> " + w.quote(codec_.DumpMetadata(*options.filter)) + "::jsonb";
    }
    if (options.before && options.before->checkpoint_id) {
      sql += " AND c.checkpoint_id < " + w.quote(*options.before->checkpoint_id);
    }
    sql += " ORDER BY c.checkpoint_id DESC";
    if (options.limit && *options.limit > 0) {
      sql += " LIMIT " + std::to_string(*options.limit);
    }

    auto result = w.exec(sql);
    tx.Commit();

    std::vector<RawCheckpointRow> rows;
    rows.reserve(result.size());
    for (const auto& r : result) {
      rows.push_back(ReadRow(r));
    }
    return rows;
  });
}

std::optional<checkpoint::ChannelVersions> PostgresSaver::FetchVersionsOnLoop(const CheckpointConfig& config) {
  auto json = WithStorageErrors("read parent versions", [&]() -> std::optional<std::string> {
    PgTransaction tx(conn_->Get(), "parent_versions");
    auto result = tx.Work().exec_prepared("select_versions", config.thread_id, config.checkpoint_ns, *config.checkpoint_id);
    tx.Commit();
    if (result.empty()) return std::nullopt;
    return result[0][0].as<std::string>();
  });
  if (!json) return std::nullopt;
  return checkpoint::ParseVersionsJson(*json);
}

void PostgresSaver::WriteCheckpointOnLoop(const CheckpointConfig& stored, const std::optional<std::string>& parent_checkpoint_id,
                                          const std::string& checkpoint_json, const std::string& metadata_json,
                                          const std::vector<checkpoint::BlobRow>& blobs) {
  WithStorageErrors("put checkpoint", [&] {
    PgTransaction tx(conn_->Get(), "put");
    auto&         w = tx.Work();

    if (options_.pipeline) {
      std::vector<std::string> statements;
      statements.reserve(blobs.size() + 1);
      for (const auto& blob : blobs) {
        statements.push_back(InsertBlobLiteral(w, blob));
      }
      statements.push_back(UpsertCheckpointLiteral(w, stored, parent_checkpoint_id, checkpoint_json, metadata_json));
      RunPipelined(w, statements);
    } else {
      for (const auto& blob : blobs) {
        w.exec_prepared("insert_blob", blob.thread_id, blob.channel, blob.version, blob.type, Base64Param(blob.blob));
      }
      w.exec_prepared("upsert_checkpoint", stored.thread_id, stored.checkpoint_ns, *stored.checkpoint_id, parent_checkpoint_id,
                      checkpoint_json, metadata_json);
    }
    tx.Commit();
  });
}

void PostgresSaver::WriteWritesOnLoop(const std::vector<checkpoint::WriteRow>& rows) {
  WithStorageErrors("put writes", [&] {
    PgTransaction tx(conn_->Get(), "put_writes");
    auto&         w = tx.Work();

    if (options_.pipeline) {
      std::vector<std::string> statements;
      statements.reserve(rows.size());
      for (const auto& row : rows) {
        statements.push_back(InsertWriteLiteral(w, row));
      }
      RunPipelined(w, statements);
    } else {
      for (const auto& row : rows) {
        w.exec_prepared("insert_write", row.thread_id, row.checkpoint_ns, row.checkpoint_id, row.task_id, row.idx, row.channel,
                        row.type, util::Base64Encode(row.blob));
      }
    }
    tx.Commit();
  });
}

std::future<TupleResult> PostgresSaver::AGetTuple(const CheckpointConfig& config) {
  checkpoint::RequireThread(config);

  auto lookup = cache_.Claim(config);
  if (lookup.status == checkpoint::LatestTupleCache::LookupStatus::kPending) {
    return std::move(lookup.pending);
  }

  auto promise = std::make_shared<std::promise<TupleResult>>();
  auto future  = promise->get_future();
  if (lookup.status == checkpoint::LatestTupleCache::LookupStatus::kHit) {
    promise->set_value(std::move(lookup.tuple));
    return future;
  }

  PostGuarded(
      *loop_,
      [this, promise, config] {
        auto span = observability::StoreSpan("postgres", "get_tuple", config.thread_id);

        EnsureSetupOnLoop();
        auto row = FetchRowOnLoop(config);
        if (!row) {
          promise->set_value(std::nullopt);
          return;
        }
        PostGuarded(
            *cpu_,
            [this, promise, row = std::move(*row)] {
              auto tuple = codec_.DecodeRow(row);
              cache_.NoteVersions(tuple);
              promise->set_value(std::move(tuple));
            },
            Rejecter(promise));
      },
      Rejecter(promise));
  return future;
}

void PostgresSaver::PrefetchLatest(const CheckpointConfig& config) {
  checkpoint::RequireThread(config);

  const auto generation = cache_.Arm(config);
  if (!generation) return;

  CheckpointConfig latest;
  latest.thread_id     = config.thread_id;
  latest.checkpoint_ns = config.checkpoint_ns;

  const uint64_t gen  = *generation;
  auto           fail = [this, gen](std::exception_ptr error) { cache_.Fail(gen, error); };
  PostGuarded(
      *loop_,
      [this, gen, latest, fail] {
        EnsureSetupOnLoop();
        auto row = FetchRowOnLoop(latest);
        if (!row) {
          cache_.Complete(gen, std::nullopt);
          return;
        }
        PostGuarded(
            *cpu_, [this, gen, row = std::move(*row)] { cache_.Complete(gen, codec_.DecodeRow(row)); }, fail);
      },
      fail);
}

std::unique_ptr<checkpoint::AsyncCheckpointStream> PostgresSaver::AList(const std::optional<CheckpointConfig>& config,
                                                                        const checkpoint::ListOptions& options) {
  if (config) checkpoint::RequireThread(*config);

  auto promise = std::make_shared<std::promise<std::vector<RawCheckpointRow>>>();
  std::shared_future<std::vector<RawCheckpointRow>> rows = promise->get_future().share();

  PostGuarded(
      *loop_,
      [this, promise, config, options] {
        auto span = observability::StoreSpan("postgres", "list", config ? std::string_view(config->thread_id) : std::string_view());
        EnsureSetupOnLoop();
        auto fetched = FetchRowsOnLoop(config, options);
        span.SetAttribute("rows", static_cast<std::int64_t>(fetched.size()));
        promise->set_value(std::move(fetched));
      },
      Rejecter(promise));

  return std::make_unique<PgCheckpointStream>(std::move(rows), codec_, *cpu_);
}

std::future<CheckpointConfig> PostgresSaver::APut(const CheckpointConfig& config, const checkpoint::Checkpoint& checkpoint,
                                                  const checkpoint::Metadata& metadata) {
  checkpoint::RequireThread(config);

  auto stored = std::make_shared<checkpoint::Checkpoint>(checkpoint::CopyCheckpoint(checkpoint));
  stored->set_id(checkpoint::ResolveCheckpointId(checkpoint, id_policy_));

  std::optional<std::string> parent = config.checkpoint_id;
  const bool                 same_id = parent && *parent == stored->id();
  if (same_id) {
    // same-id upsert keeps its original lineage
    parent.reset();
  }

  auto merged = std::make_shared<checkpoint::Metadata>(checkpoint::MergeMetadata(config, metadata));

  CheckpointConfig next;
  next.thread_id     = config.thread_id;
  next.checkpoint_ns = config.checkpoint_ns;
  next.checkpoint_id = stored->id();

  auto promise = std::make_shared<std::promise<CheckpointConfig>>();
  auto future  = promise->get_future();

  PostGuarded(
      *loop_,
      [this, promise, config, next, parent, same_id, stored, merged] {
        EnsureSetupOnLoop();

        std::optional<checkpoint::ChannelVersions> previous;
        if (parent) {
          previous = cache_.PreviousVersions(config);
          if (!previous) previous = FetchVersionsOnLoop(config);
        }

        PostGuarded(
            *cpu_,
            [this, promise, next, parent, same_id, stored, merged, previous] {
              auto blobs = std::make_shared<std::vector<checkpoint::BlobRow>>(codec_.DumpBlobs(
                  next.thread_id, stored->channel_values(), stored->channel_versions(), previous ? &*previous : nullptr));
              auto checkpoint_json = codec_.DumpCheckpoint(*stored);
              auto metadata_json   = codec_.DumpMetadata(*merged);

              PostGuarded(
                  *loop_,
                  [this, promise, next, parent, same_id, stored, merged, blobs, checkpoint_json, metadata_json] {
                    auto span = observability::StoreSpan("postgres", "put", next.thread_id);
                    span.SetAttribute("blobs", static_cast<std::int64_t>(blobs->size()));

                    WriteCheckpointOnLoop(next, parent, checkpoint_json, metadata_json, *blobs);

                    if (same_id) {
                      cache_.Invalidate(next);
                    } else {
                      CheckpointTuple tuple;
                      tuple.config     = next;
                      tuple.checkpoint = *stored;
                      tuple.metadata   = *merged;
                      if (parent) {
                        CheckpointConfig parent_config;
                        parent_config.thread_id     = next.thread_id;
                        parent_config.checkpoint_ns = next.checkpoint_ns;
                        parent_config.checkpoint_id = parent;
                        tuple.parent_config         = std::move(parent_config);
                      }
                      cache_.Remember(tuple);
                    }

                    WAYPOINT_LOG_DEBUG("checkpoint stored", {observability::StringField("thread_id", next.thread_id),
                                                             observability::StringField("checkpoint_id", *next.checkpoint_id),
                                                             observability::IntField("blobs", static_cast<std::int64_t>(blobs->size()))});
                    promise->set_value(next);
                  },
                  Rejecter(promise));
            },
            Rejecter(promise));
      },
      Rejecter(promise));
  return future;
}

std::future<void> PostgresSaver::APutWrites(const CheckpointConfig& config, const std::vector<checkpoint::ChannelWrite>& writes,
                                            const std::string& task_id) {
  checkpoint::RequireThread(config);
  if (!config.checkpoint_id) {
    throw util::InvalidArgument("PutWrites requires a checkpoint_id");
  }

  auto promise = std::make_shared<std::promise<void>>();
  auto future  = promise->get_future();

  PostGuarded(
      *cpu_,
      [this, promise, config, writes, task_id] {
        auto rows = std::make_shared<std::vector<checkpoint::WriteRow>>(codec_.DumpWrites(config, *config.checkpoint_id, task_id, writes));
        PostGuarded(
            *loop_,
            [this, promise, config, rows] {
              auto span = observability::StoreSpan("postgres", "put_writes", config.thread_id);

              EnsureSetupOnLoop();
              WriteWritesOnLoop(*rows);
              cache_.Invalidate(config);
              promise->set_value();
            },
            Rejecter(promise));
      },
      Rejecter(promise));
  return future;
}

} // namespace waypoint::db::postgres
