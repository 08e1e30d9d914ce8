#pragma once

#include <cstdint>
#include <string>

#include "internal/db/model/catalog_entry_record.hpp"

namespace registry::db::sql {

/*
  Generic row reader.

  Backends wrap their result row:
    postgres -> pqxx::row
    sqlite   -> sqlite3_stmt

  Prevents driver types leaking into repository logic.
*/

class Row {
public:
  virtual ~Row() = default;

  virtual std::string GetText(int col) const = 0;
  virtual int GetInt(int col) const = 0;
  virtual int64_t GetInt64(int col) const = 0;
  virtual bool IsNull(int col) const = 0;

  uint64_t GetU64(int col) const {
    return static_cast<uint64_t>(GetInt64(col));
  }
};

// Column order matches REGISTRY_ENTRY_COLUMNS.
inline model::CatalogEntryRecord ReadEntryRow(const Row& row) {
  model::CatalogEntryRecord r;
  r.id             = row.GetText(0);
  r.name           = row.GetText(1);
  r.version        = row.GetText(2);
  r.content_hash   = row.GetText(3);
  r.size_bytes     = row.GetU64(4);
  r.state          = static_cast<registry::v1::EntryState>(row.GetInt(5));
  r.uploader       = row.GetText(6);
  r.created_at_ms  = row.GetU64(7);
  r.updated_at_ms  = row.GetU64(8);
  r.delete_reason  = row.GetText(9);
  r.download_count = row.GetU64(10);
  return r;
}

} // namespace registry::db::sql
