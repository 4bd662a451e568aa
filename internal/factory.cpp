#include "factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/serde/legacy_compat_serializer.hpp"
#if WAYPOINT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_saver.hpp"
#endif
#if WAYPOINT_DB_POSTGRES
#include "internal/db/postgres/pg_saver.hpp"
#endif

namespace waypoint::factory {

using waypoint::runtime::config::RuntimeConfig;

namespace {

#if WAYPOINT_DB_SQLITE
std::unique_ptr<checkpoint::BaseCheckpointSaver> BuildSqliteSaver(const waypoint::runtime::config::SqliteConfig& sqlite,
                                                                  const RuntimeConfig& config) {
  const std::string path = sqlite.path().empty() ? ":memory:" : sqlite.path();

  db::sqlite::SqliteOptions options;
  options.wal_mode = sqlite.wal_mode();
  if (sqlite.busy_timeout_ms() > 0) {
    options.busy_timeout_ms = static_cast<int>(sqlite.busy_timeout_ms());
  }

  auto db = std::make_shared<db::sqlite::SqliteDB>(path, options);
  WAYPOINT_LOG_INFO("using sqlite checkpoint store", {observability::StringField("path", path)});
  return std::make_unique<db::sqlite::SqliteSaver>(std::move(db), BuildSerializer(config), BuildIdPolicy(config));
}
#endif

} // namespace

void InitializeRuntime(const RuntimeConfig& config) {
  observability::InitializeLogging(config);
  if (observability::InitializeTracing(config)) {
    WAYPOINT_LOG_INFO("tracing enabled", {observability::StringField("endpoint", config.tracing().endpoint())});
  }
}

void ShutdownRuntime() {
  observability::ShutdownTracing();
  observability::ShutdownLogging();
}

std::shared_ptr<const serde::SerializerProtocol> BuildSerializer(const RuntimeConfig& config) {
  return std::make_shared<serde::LegacyCompatSerializer>(config.serde().binary());
}

checkpoint::CheckpointIdPolicy BuildIdPolicy(const RuntimeConfig& config) {
  switch (config.checkpoint().id_policy()) {
    case waypoint::runtime::config::CHECKPOINT_ID_POLICY_ALWAYS_NEW:
      return checkpoint::CheckpointIdPolicy::kAlwaysNew;
    default:
      return checkpoint::CheckpointIdPolicy::kPreserve;
  }
}

std::unique_ptr<checkpoint::BaseCheckpointSaver> BuildSaver(const RuntimeConfig& config) {
  const auto& database = config.database();

  if (database.has_postgres()) {
#if WAYPOINT_DB_POSTGRES
    const auto& postgres = database.postgres();
    if (postgres.connection_uri().empty()) {
      throw std::runtime_error("postgres backend requires database.postgres.connection_uri");
    }

    db::postgres::PostgresOptions options;
    options.pipeline = postgres.pipeline();
    if (postgres.worker_threads() > 0) {
      options.worker_threads = postgres.worker_threads();
    }
    WAYPOINT_LOG_INFO("using postgres checkpoint store", {observability::BoolField("pipeline", options.pipeline)});
    return std::make_unique<db::postgres::PostgresSaver>(postgres.connection_uri(), options, BuildSerializer(config),
                                                         BuildIdPolicy(config));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

#if WAYPOINT_DB_SQLITE
  return BuildSqliteSaver(database.has_sqlite() ? database.sqlite() : waypoint::runtime::config::SqliteConfig(), config);
#else
  throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
}

} // namespace waypoint::factory
