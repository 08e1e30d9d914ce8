#pragma once

namespace registry::db::sql {

/*
  Canonical catalog SQL.

  Written with '?' placeholders (SQLite). The Postgres backend prepares the
  same statements with $n placeholders in PgPool::PrepareStatements.
*/

#define REGISTRY_ENTRY_COLUMNS \
  "id,name,version,content_hash,size_bytes,state,uploader,created_at_ms,updated_at_ms,delete_reason,download_count"

static constexpr const char* INSERT_ENTRY =
    "INSERT INTO catalog_entry(" REGISTRY_ENTRY_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_ENTRY =
    "SELECT " REGISTRY_ENTRY_COLUMNS " FROM catalog_entry WHERE id=?;";

static constexpr const char* SELECT_LIVE_ENTRY =
    "SELECT " REGISTRY_ENTRY_COLUMNS " FROM catalog_entry WHERE name=? AND version=? AND state<>3;";

static constexpr const char* SELECT_ENTRIES_BY_NAME =
    "SELECT " REGISTRY_ENTRY_COLUMNS " FROM catalog_entry WHERE name=? ORDER BY created_at_ms;";

static constexpr const char* SELECT_ENTRIES_BY_STATE =
    "SELECT " REGISTRY_ENTRY_COLUMNS " FROM catalog_entry WHERE state=? AND updated_at_ms<? ORDER BY updated_at_ms;";

static constexpr const char* SELECT_PACKAGE_NAMES =
    "SELECT DISTINCT name FROM catalog_entry WHERE state=2 ORDER BY name;";

static constexpr const char* UPDATE_ENTRY =
    "UPDATE catalog_entry SET content_hash=?,size_bytes=?,state=?,uploader=?,updated_at_ms=?,delete_reason=?,download_count=?"
    " WHERE id=?;";

static constexpr const char* DELETE_ENTRY =
    "DELETE FROM catalog_entry WHERE id=?;";

static constexpr const char* INCREMENT_DOWNLOADS =
    "UPDATE catalog_entry SET download_count=download_count+1 WHERE id=?;";

static constexpr const char* SELECT_REFERENCED_HASHES =
    "SELECT DISTINCT content_hash FROM catalog_entry;";

static constexpr const char* SELECT_HASH_REFERENCED =
    "SELECT 1 FROM catalog_entry WHERE content_hash=? LIMIT 1;";

} // namespace registry::db::sql
