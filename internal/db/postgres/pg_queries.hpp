#pragma once

namespace waypoint::db::postgres {

/*
  SQL of the split storage layout.

  Channel values are re-joined from checkpoint_blobs through the
  checkpoint's channel_versions and come back, like pending writes, as a
  JSON aggregate with base64 payloads.
*/

inline constexpr const char* kSchema[] = {
    "CREATE TABLE IF NOT EXISTS checkpoints ("
    "thread_id TEXT NOT NULL, checkpoint_ns TEXT NOT NULL DEFAULT '', checkpoint_id TEXT NOT NULL, parent_checkpoint_id TEXT, "
    "checkpoint JSONB NOT NULL, metadata JSONB NOT NULL DEFAULT '{}', PRIMARY KEY (thread_id, checkpoint_ns, checkpoint_id));",
    "CREATE TABLE IF NOT EXISTS checkpoint_blobs ("
    "thread_id TEXT NOT NULL, channel TEXT NOT NULL, version TEXT NOT NULL, type TEXT NOT NULL, blob BYTEA, "
    "PRIMARY KEY (thread_id, channel, version));",
    "CREATE TABLE IF NOT EXISTS checkpoint_writes ("
    "thread_id TEXT NOT NULL, checkpoint_ns TEXT NOT NULL DEFAULT '', checkpoint_id TEXT NOT NULL, task_id TEXT NOT NULL, idx INTEGER NOT NULL, "
    "channel TEXT NOT NULL, type TEXT, blob BYTEA NOT NULL, PRIMARY KEY (thread_id, checkpoint_ns, checkpoint_id, task_id, idx));",
    "CREATE INDEX IF NOT EXISTS checkpoints_thread_id_idx ON checkpoints (thread_id);",
    "CREATE INDEX IF NOT EXISTS checkpoint_blobs_thread_id_idx ON checkpoint_blobs (thread_id);",
    "CREATE INDEX IF NOT EXISTS checkpoint_writes_thread_id_idx ON checkpoint_writes (thread_id);",
};

#define WAYPOINT_PG_SELECT_CHECKPOINT                                                                                          \
  "SELECT c.thread_id, c.checkpoint_ns, c.checkpoint_id, c.parent_checkpoint_id, c.checkpoint::text, c.metadata::text, "    \
  "(SELECT jsonb_agg(jsonb_build_array(bl.channel, bl.type, encode(bl.blob, 'base64')))::text "                               \
  "FROM jsonb_each_text(c.checkpoint -> 'channel_versions') AS cv "                                                         \
  "JOIN checkpoint_blobs bl ON bl.thread_id = c.thread_id AND bl.channel = cv.key AND bl.version = cv.value) AS channel_values, " \
  "(SELECT jsonb_agg(jsonb_build_array(cw.task_id, cw.channel, cw.type, encode(cw.blob, 'base64')) ORDER BY cw.task_id, cw.idx)::text " \
  "FROM checkpoint_writes cw WHERE cw.thread_id = c.thread_id AND cw.checkpoint_ns = c.checkpoint_ns "                      \
  "AND cw.checkpoint_id = c.checkpoint_id) AS pending_writes "                                                               \
  "FROM checkpoints c"

inline constexpr const char* kSelectCheckpoint = WAYPOINT_PG_SELECT_CHECKPOINT;

inline constexpr const char* kSelectLatest =
    WAYPOINT_PG_SELECT_CHECKPOINT " WHERE c.thread_id = $1 AND c.checkpoint_ns = $2 ORDER BY c.checkpoint_id DESC LIMIT 1";

inline constexpr const char* kSelectById =
    WAYPOINT_PG_SELECT_CHECKPOINT " WHERE c.thread_id = $1 AND c.checkpoint_ns = $2 AND c.checkpoint_id = $3";

#undef WAYPOINT_PG_SELECT_CHECKPOINT

inline constexpr const char* kSelectVersions =
    "SELECT COALESCE(checkpoint -> 'channel_versions', '{}'::jsonb)::text FROM checkpoints "
    "WHERE thread_id = $1 AND checkpoint_ns = $2 AND checkpoint_id = $3";

inline constexpr const char* kUpsertCheckpoint =
    "INSERT INTO checkpoints (thread_id, checkpoint_ns, checkpoint_id, parent_checkpoint_id, checkpoint, metadata) "
    "VALUES ($1, $2, $3, $4, $5::jsonb, $6::jsonb) "
    "ON CONFLICT (thread_id, checkpoint_ns, checkpoint_id) DO UPDATE SET "
    "parent_checkpoint_id = COALESCE(EXCLUDED.parent_checkpoint_id, checkpoints.parent_checkpoint_id), "
    "checkpoint = EXCLUDED.checkpoint, metadata = EXCLUDED.metadata";

inline constexpr const char* kInsertBlob =
    "INSERT INTO checkpoint_blobs (thread_id, channel, version, type, blob) "
    "VALUES ($1, $2, $3, $4, decode($5, 'base64')) "
    "ON CONFLICT (thread_id, channel, version) DO NOTHING";

inline constexpr const char* kInsertWrite =
    "INSERT INTO checkpoint_writes (thread_id, checkpoint_ns, checkpoint_id, task_id, idx, channel, type, blob) "
    "VALUES ($1, $2, $3, $4, $5, $6, $7, decode($8, 'base64')) "
    "ON CONFLICT (thread_id, checkpoint_ns, checkpoint_id, task_id, idx) DO NOTHING";

} // namespace waypoint::db::postgres
