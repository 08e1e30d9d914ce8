#pragma once

#include <string>
#include <vector>

namespace registry::db::sql {

/*
  Catalog schema.

  state values follow registry.v1.EntryState:
    1 pending, 2 published, 3 deleted

  The partial unique index is the only point of mutual exclusion for
  concurrent publishes of the same (name, version).
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS catalog_entry ("
      " id TEXT PRIMARY KEY,"
      " name TEXT NOT NULL,"
      " version TEXT NOT NULL,"
      " content_hash TEXT NOT NULL,"
      " size_bytes INTEGER NOT NULL,"
      " state INTEGER NOT NULL,"
      " uploader TEXT NOT NULL DEFAULT '',"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL,"
      " delete_reason TEXT NOT NULL DEFAULT '',"
      " download_count INTEGER NOT NULL DEFAULT 0);",
      "CREATE UNIQUE INDEX IF NOT EXISTS catalog_entry_live_uq ON catalog_entry(name, version) WHERE state <> 3;",
      "CREATE INDEX IF NOT EXISTS catalog_entry_hash_idx ON catalog_entry(content_hash);",
      "CREATE INDEX IF NOT EXISTS catalog_entry_state_idx ON catalog_entry(state, updated_at_ms);",
      "CREATE TABLE IF NOT EXISTS catalog_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
  };
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS catalog_entry ("
      " id TEXT PRIMARY KEY,"
      " name TEXT NOT NULL,"
      " version TEXT NOT NULL,"
      " content_hash TEXT NOT NULL,"
      " size_bytes BIGINT NOT NULL,"
      " state SMALLINT NOT NULL,"
      " uploader TEXT NOT NULL DEFAULT '',"
      " created_at_ms BIGINT NOT NULL,"
      " updated_at_ms BIGINT NOT NULL,"
      " delete_reason TEXT NOT NULL DEFAULT '',"
      " download_count BIGINT NOT NULL DEFAULT 0);",
      "CREATE UNIQUE INDEX IF NOT EXISTS catalog_entry_live_uq ON catalog_entry(name, version) WHERE state <> 3;",
      "CREATE INDEX IF NOT EXISTS catalog_entry_hash_idx ON catalog_entry(content_hash);",
      "CREATE INDEX IF NOT EXISTS catalog_entry_state_idx ON catalog_entry(state, updated_at_ms);",
      "CREATE TABLE IF NOT EXISTS catalog_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());",
  };
  return kSchema;
}

} // namespace registry::db::sql
