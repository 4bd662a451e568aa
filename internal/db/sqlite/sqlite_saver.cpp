#include "sqlite_saver.hpp"

#include <variant>

#include "internal/checkpoint/checkpoint.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/serde/legacy_compat_serializer.hpp"
#include "internal/util/errors.hpp"

namespace waypoint::db::sqlite {

using checkpoint::CheckpointConfig;
using checkpoint::CheckpointTuple;

namespace {

const char* const kSchema[] = {
    "CREATE TABLE IF NOT EXISTS checkpoints (thread_id TEXT NOT NULL, checkpoint_ns TEXT NOT NULL DEFAULT '', checkpoint_id TEXT NOT NULL, "
    "parent_checkpoint_id TEXT, checkpoint BLOB, metadata BLOB, PRIMARY KEY (thread_id, checkpoint_ns, checkpoint_id));",
    "CREATE TABLE IF NOT EXISTS writes (thread_id TEXT NOT NULL, checkpoint_ns TEXT NOT NULL DEFAULT '', checkpoint_id TEXT NOT NULL, "
    "task_id TEXT NOT NULL, idx INTEGER NOT NULL, channel TEXT NOT NULL, type TEXT, value BLOB, "
    "PRIMARY KEY (thread_id, checkpoint_ns, checkpoint_id, task_id, idx));",
};

constexpr const char* kSelectCheckpoint =
    "SELECT thread_id, checkpoint_ns, checkpoint_id, parent_checkpoint_id, checkpoint, metadata FROM checkpoints";

using Param = std::variant<std::string, double, int64_t>;

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindParam(sqlite3_stmt* st, int idx, const Param& param) {
  if (const auto* text = std::get_if<std::string>(&param)) {
    BindText(st, idx, *text);
  } else if (const auto* number = std::get_if<double>(&param)) {
    sqlite3_bind_double(st, idx, *number);
  } else {
    sqlite3_bind_int64(st, idx, std::get<int64_t>(param));
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string();
}

SqliteSaver::StoredRow ReadRow(sqlite3_stmt* st) {
  SqliteSaver::StoredRow row;
  row.thread_id            = ColText(st, 0);
  row.checkpoint_ns        = ColText(st, 1);
  row.checkpoint_id        = ColText(st, 2);
  row.parent_checkpoint_id = ColOptionalText(st, 3);
  row.checkpoint           = ColBlob(st, 4);
  row.metadata             = ColBlob(st, 5);
  return row;
}

std::string MetadataPath(const std::string& key) {
  return "$.\"" + key + "\"";
}

// Rows still in the legacy frame are not JSON and never match a filter.
constexpr const char* kMetadataJson = "(CASE WHEN json_valid(CAST(metadata AS TEXT)) THEN CAST(metadata AS TEXT) END)";

// One json_extract predicate per filter key; all must hold.
void AppendMetadataFilter(const serde::SerializerProtocol& serde, const checkpoint::Metadata& filter, std::string* sql,
                          std::vector<Param>* params) {
  for (const auto& [key, value] : filter.fields()) {
    switch (value.kind_case()) {
      case google::protobuf::Value::kNullValue:
        *sql += std::string(" AND json_type(") + kMetadataJson + ", ?) = 'null'";
        params->push_back(MetadataPath(key));
        break;
      case google::protobuf::Value::kBoolValue:
        *sql += std::string(" AND json_type(") + kMetadataJson + ", ?) = ?";
        params->push_back(MetadataPath(key));
        params->push_back(std::string(value.bool_value() ? "true" : "false"));
        break;
      case google::protobuf::Value::kNumberValue:
        *sql += std::string(" AND json_extract(") + kMetadataJson + ", ?) = ?";
        params->push_back(MetadataPath(key));
        params->push_back(value.number_value());
        break;
      case google::protobuf::Value::kStringValue:
        *sql += std::string(" AND json_extract(") + kMetadataJson + ", ?) = ?";
        params->push_back(MetadataPath(key));
        params->push_back(value.string_value());
        break;
      default:
        *sql += std::string(" AND json_extract(") + kMetadataJson + ", ?) = json(?)";
        params->push_back(MetadataPath(key));
        params->push_back(serde.Dumps(value));
        break;
    }
  }
}

CheckpointTuple DecodeRow(const serde::SerializerProtocol& serde, const SqliteSaver::StoredRow& row) {
  CheckpointTuple tuple;
  tuple.config.thread_id     = row.thread_id;
  tuple.config.checkpoint_ns = row.checkpoint_ns;
  tuple.config.checkpoint_id = row.checkpoint_id;

  serde.Loads(row.checkpoint, &tuple.checkpoint);
  if (!row.metadata.empty()) {
    serde.Loads(row.metadata, &tuple.metadata);
  }

  if (row.parent_checkpoint_id) {
    CheckpointConfig parent;
    parent.thread_id     = row.thread_id;
    parent.checkpoint_ns = row.checkpoint_ns;
    parent.checkpoint_id = row.parent_checkpoint_id;
    tuple.parent_config  = std::move(parent);
  }

  for (const auto& write : row.writes) {
    checkpoint::PendingWrite pending;
    pending.task_id = write.task_id;
    pending.channel = write.channel;
    serde.LoadsTyped({write.type, write.blob}, &pending.value);
    tuple.pending_writes.push_back(std::move(pending));
  }
  return tuple;
}

class SqliteCheckpointStream final : public checkpoint::CheckpointStream {
 public:
  SqliteCheckpointStream(std::shared_ptr<const serde::SerializerProtocol> serde, std::vector<SqliteSaver::StoredRow> rows)
      : serde_(std::move(serde)), rows_(std::move(rows)) {
  }

  std::optional<CheckpointTuple> Next() override {
    if (index_ >= rows_.size()) return std::nullopt;
    return DecodeRow(*serde_, rows_[index_++]);
  }

 private:
  std::shared_ptr<const serde::SerializerProtocol> serde_;
  std::vector<SqliteSaver::StoredRow>              rows_;
  std::size_t                                      index_ = 0;
};

} // namespace

SqliteSaver::SqliteSaver(std::shared_ptr<SqliteDB> db, std::shared_ptr<const serde::SerializerProtocol> serde,
                         checkpoint::CheckpointIdPolicy id_policy)
    : BaseCheckpointSaver(serde ? std::move(serde) : std::make_shared<serde::LegacyCompatSerializer>(), id_policy), db_(std::move(db)) {
  if (!db_) {
    throw util::InvalidArgument("SqliteSaver requires a database");
  }
}

void SqliteSaver::Setup() {
  std::lock_guard lock(mutex_);
  SetupLocked();
}

void SqliteSaver::SetupLocked() {
  if (is_setup_) return;

  for (const char* sql : kSchema) {
    db_->Exec(sql);
  }
  is_setup_ = true;
  WAYPOINT_LOG_INFO("sqlite checkpoint schema ready", {observability::StringField("path", db_->Path())});
}

std::vector<checkpoint::WriteRow> SqliteSaver::ReadWrites(const StoredRow& row) {
  auto st = db_->Prepare(
      "SELECT task_id, channel, type, value FROM writes WHERE thread_id = ? AND checkpoint_ns = ? AND checkpoint_id = ? "
      "ORDER BY task_id, idx;");
  BindText(st.get(), 1, row.thread_id);
  BindText(st.get(), 2, row.checkpoint_ns);
  BindText(st.get(), 3, row.checkpoint_id);

  std::vector<checkpoint::WriteRow> writes;
  int                               rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    checkpoint::WriteRow write;
    write.thread_id     = row.thread_id;
    write.checkpoint_ns = row.checkpoint_ns;
    write.checkpoint_id = row.checkpoint_id;
    write.task_id       = ColText(st.get(), 0);
    write.channel       = ColText(st.get(), 1);
    write.type          = ColText(st.get(), 2);
    write.blob          = ColBlob(st.get(), 3);
    write.idx           = static_cast<int>(writes.size());
    writes.push_back(std::move(write));
  }
  Check(db_->Handle(), rc, "read writes");
  return writes;
}

std::optional<CheckpointTuple> SqliteSaver::GetTuple(const CheckpointConfig& config) {
  checkpoint::RequireThread(config);
  auto span = observability::StoreSpan("sqlite", "get_tuple", config.thread_id);

  std::optional<StoredRow> row;
  {
    std::lock_guard lock(mutex_);
    SetupLocked();
    SqliteTransaction tx(db_, "get_tuple");

    std::string sql = std::string(kSelectCheckpoint) + " WHERE thread_id = ? AND checkpoint_ns = ?";
    sql += config.checkpoint_id ? " AND checkpoint_id = ?;" : " ORDER BY checkpoint_id DESC LIMIT 1;";

    auto st = db_->Prepare(sql);
    BindText(st.get(), 1, config.thread_id);
    BindText(st.get(), 2, config.checkpoint_ns);
    if (config.checkpoint_id) BindText(st.get(), 3, *config.checkpoint_id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_ROW) {
      row = ReadRow(st.get());
    } else {
      Check(db_->Handle(), rc, "get checkpoint");
    }
    st.reset();

    if (row) row->writes = ReadWrites(*row);
    tx.Commit();
  }

  if (!row) return std::nullopt;
  return DecodeRow(*serde_, *row);
}

std::unique_ptr<checkpoint::CheckpointStream> SqliteSaver::List(const std::optional<CheckpointConfig>& config,
                                                                const checkpoint::ListOptions& options) {
  auto span = observability::StoreSpan("sqlite", "list", config ? std::string_view(config->thread_id) : std::string_view());

  std::string        sql = std::string(kSelectCheckpoint) + " WHERE 1 = 1";
  std::vector<Param> params;
  if (config) {
    checkpoint::RequireThread(*config);
    sql += " AND thread_id = ? AND checkpoint_ns = ?";
    params.push_back(config->thread_id);
    params.push_back(config->checkpoint_ns);
    if (config->checkpoint_id) {
      sql += " AND checkpoint_id = ?";
      params.push_back(*config->checkpoint_id);
    }
  }
  if (options.filter) {
    AppendMetadataFilter(*serde_, *options.filter, &sql, &params);
  }
  if (options.before && options.before->checkpoint_id) {
    sql += " AND checkpoint_id < ?";
    params.push_back(*options.before->checkpoint_id);
  }
  sql += " ORDER BY checkpoint_id DESC";
  if (options.limit && *options.limit > 0) {
    sql += " LIMIT ?";
    params.push_back(static_cast<int64_t>(*options.limit));
  }
  sql += ";";

  std::vector<StoredRow> rows;
  {
    std::lock_guard lock(mutex_);
    SetupLocked();
    SqliteTransaction tx(db_, "list");

    auto st = db_->Prepare(sql);
    for (std::size_t i = 0; i < params.size(); ++i) {
      BindParam(st.get(), static_cast<int>(i + 1), params[i]);
    }

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
      rows.push_back(ReadRow(st.get()));
    }
    Check(db_->Handle(), rc, "list checkpoints");
    st.reset();

    for (auto& row : rows) {
      row.writes = ReadWrites(row);
    }
    tx.Commit();
  }

  span.SetAttribute("rows", static_cast<std::int64_t>(rows.size()));
  return std::make_unique<SqliteCheckpointStream>(serde_, std::move(rows));
}

CheckpointConfig SqliteSaver::Put(const CheckpointConfig& config, const checkpoint::Checkpoint& checkpoint, const checkpoint::Metadata& metadata) {
  checkpoint::RequireThread(config);
  auto span = observability::StoreSpan("sqlite", "put", config.thread_id);

  auto                       stored = checkpoint::CopyCheckpoint(checkpoint);
  const auto                 id     = checkpoint::ResolveCheckpointId(checkpoint, id_policy_);
  std::optional<std::string> parent = config.checkpoint_id;
  if (parent && *parent == id) {
    // same-id upsert keeps its original lineage
    parent.reset();
  }
  stored.set_id(id);

  const auto checkpoint_blob = serde_->Dumps(stored);
  const auto metadata_blob   = serde_->Dumps(checkpoint::MergeMetadata(config, metadata));

  {
    std::lock_guard lock(mutex_);
    SetupLocked();
    SqliteTransaction tx(db_, "put");

    if (!parent) {
      // keep the parent recorded by an earlier write of the same id
      auto st = db_->Prepare("SELECT parent_checkpoint_id FROM checkpoints WHERE thread_id = ? AND checkpoint_ns = ? AND checkpoint_id = ?;");
      BindText(st.get(), 1, config.thread_id);
      BindText(st.get(), 2, config.checkpoint_ns);
      BindText(st.get(), 3, id);
      int rc = sqlite3_step(st.get());
      if (rc == SQLITE_ROW) {
        parent = ColOptionalText(st.get(), 0);
      } else {
        Check(db_->Handle(), rc, "read parent");
      }
    }

    auto st = db_->Prepare(
        "INSERT OR REPLACE INTO checkpoints (thread_id, checkpoint_ns, checkpoint_id, parent_checkpoint_id, checkpoint, metadata) "
        "VALUES (?, ?, ?, ?, ?, ?);");
    BindText(st.get(), 1, config.thread_id);
    BindText(st.get(), 2, config.checkpoint_ns);
    BindText(st.get(), 3, id);
    BindOptionalText(st.get(), 4, parent);
    BindBlob(st.get(), 5, checkpoint_blob);
    BindBlob(st.get(), 6, metadata_blob);
    Check(db_->Handle(), sqlite3_step(st.get()), "put checkpoint");
    st.reset();

    tx.Commit();
  }

  WAYPOINT_LOG_DEBUG("checkpoint stored", {observability::StringField("thread_id", config.thread_id),
                                           observability::StringField("checkpoint_id", id)});

  CheckpointConfig next;
  next.thread_id     = config.thread_id;
  next.checkpoint_ns = config.checkpoint_ns;
  next.checkpoint_id = id;
  return next;
}

void SqliteSaver::PutWrites(const CheckpointConfig& config, const std::vector<checkpoint::ChannelWrite>& writes, const std::string& task_id) {
  checkpoint::RequireThread(config);
  if (!config.checkpoint_id) {
    throw util::InvalidArgument("PutWrites requires a checkpoint_id");
  }
  auto span = observability::StoreSpan("sqlite", "put_writes", config.thread_id);
  span.SetAttribute("task_id", task_id);

  std::vector<serde::TypedBlob> encoded;
  encoded.reserve(writes.size());
  for (const auto& [channel, value] : writes) {
    encoded.push_back(serde_->DumpsTyped(value));
  }

  std::lock_guard lock(mutex_);
  SetupLocked();
  SqliteTransaction tx(db_, "put_writes");

  auto st = db_->Prepare(
      "INSERT OR IGNORE INTO writes (thread_id, checkpoint_ns, checkpoint_id, task_id, idx, channel, type, value) "
      "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
  for (std::size_t idx = 0; idx < writes.size(); ++idx) {
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());
    BindText(st.get(), 1, config.thread_id);
    BindText(st.get(), 2, config.checkpoint_ns);
    BindText(st.get(), 3, *config.checkpoint_id);
    BindText(st.get(), 4, task_id);
    sqlite3_bind_int(st.get(), 5, static_cast<int>(idx));
    BindText(st.get(), 6, writes[idx].first);
    BindText(st.get(), 7, encoded[idx].type);
    BindBlob(st.get(), 8, encoded[idx].data);
    Check(db_->Handle(), sqlite3_step(st.get()), "put writes");
  }
  st.reset();

  tx.Commit();
}

} // namespace waypoint::db::sqlite
