#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sql/sql_row.hpp"
#include "internal/util/errors.hpp"

namespace registry::db::sqlite {

using registry::db::ErrorCode;
using registry::db::Result;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

class SqliteRow final : public sql::Row {
public:
  explicit SqliteRow(sqlite3_stmt* st) : st_(st) {}

  std::string GetText(int col) const override {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? reinterpret_cast<const char*>(t) : "";
  }
  int GetInt(int col) const override { return sqlite3_column_int(st_, col); }
  int64_t GetInt64(int col) const override { return sqlite3_column_int64(st_, col); }
  bool IsNull(int col) const override { return sqlite3_column_type(st_, col) == SQLITE_NULL; }

private:
  sqlite3_stmt* st_;
};

// Finalizes on scope exit.
class Statement {
public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() { sqlite3_finalize(st_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return st_; }

  // Steps once; throws on anything other than ROW/DONE.
  bool StepRow() {
    const int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    const int primary = rc & 0xff;
    if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
      throw util::TransientStorageError(std::string("sqlite: ") + sqlite3_errmsg(db_));
    }
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db_));
  }

private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

std::vector<model::CatalogEntryRecord> CollectEntries(Statement& st) {
  std::vector<model::CatalogEntryRecord> out;
  SqliteRow row(st.get());
  while (st.StepRow()) out.push_back(sql::ReadEntryRow(row));
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Entries
// ------------------------------------------------------------------

Result SqliteRepository::InsertEntry(Transaction& t, const model::CatalogEntryRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql::INSERT_ENTRY, -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.id);
  BindText(st, 2, r.name);
  BindText(st, 3, r.version);
  BindText(st, 4, r.content_hash);
  BindU64(st, 5, r.size_bytes);
  BindI32(st, 6, static_cast<int>(r.state));
  BindText(st, 7, r.uploader);
  BindU64(st, 8, r.created_at_ms);
  BindU64(st, 9, r.updated_at_ms);
  BindText(st, 10, r.delete_reason);
  BindU64(st, 11, r.download_count);

  int rc = sqlite3_step(st);
  Result result = Translate(db, rc);
  sqlite3_finalize(st);
  return result;
}

std::optional<model::CatalogEntryRecord> SqliteRepository::GetEntry(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), sql::SELECT_ENTRY);
  BindText(st.get(), 1, id);
  if (!st.StepRow()) return std::nullopt;
  return sql::ReadEntryRow(SqliteRow(st.get()));
}

std::optional<model::CatalogEntryRecord> SqliteRepository::FindLiveEntry(Transaction& t, const std::string& name,
                                                                          const std::string& version) {
  Statement st(TX(t).Handle(), sql::SELECT_LIVE_ENTRY);
  BindText(st.get(), 1, name);
  BindText(st.get(), 2, version);
  if (!st.StepRow()) return std::nullopt;
  return sql::ReadEntryRow(SqliteRow(st.get()));
}

std::vector<model::CatalogEntryRecord> SqliteRepository::ListEntriesByName(Transaction& t, const std::string& name) {
  Statement st(TX(t).Handle(), sql::SELECT_ENTRIES_BY_NAME);
  BindText(st.get(), 1, name);
  return CollectEntries(st);
}

std::vector<model::CatalogEntryRecord> SqliteRepository::ListEntriesByState(Transaction& t, registry::v1::EntryState state,
                                                                            uint64_t updated_before_ms) {
  Statement st(TX(t).Handle(), sql::SELECT_ENTRIES_BY_STATE);
  BindI32(st.get(), 1, static_cast<int>(state));
  BindU64(st.get(), 2, updated_before_ms);
  return CollectEntries(st);
}

std::vector<std::string> SqliteRepository::ListPackageNames(Transaction& t) {
  Statement st(TX(t).Handle(), sql::SELECT_PACKAGE_NAMES);
  SqliteRow row(st.get());
  std::vector<std::string> out;
  while (st.StepRow()) out.push_back(row.GetText(0));
  return out;
}

Result SqliteRepository::UpdateEntry(Transaction& t, const model::CatalogEntryRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql::UPDATE_ENTRY, -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.content_hash);
  BindU64(st, 2, r.size_bytes);
  BindI32(st, 3, static_cast<int>(r.state));
  BindText(st, 4, r.uploader);
  BindU64(st, 5, r.updated_at_ms);
  BindText(st, 6, r.delete_reason);
  BindU64(st, 7, r.download_count);
  BindText(st, 8, r.id);

  int rc = sqlite3_step(st);
  Result result = Translate(db, rc);
  sqlite3_finalize(st);
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

Result SqliteRepository::DeleteEntry(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql::DELETE_ENTRY, -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, id);
  int rc = sqlite3_step(st);
  Result result = Translate(db, rc);
  sqlite3_finalize(st);
  return result;
}

Result SqliteRepository::IncrementDownloadCount(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql::INCREMENT_DOWNLOADS, -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, id);
  int rc = sqlite3_step(st);
  Result result = Translate(db, rc);
  sqlite3_finalize(st);
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

// ------------------------------------------------------------------
// Blob liveness
// ------------------------------------------------------------------

std::vector<std::string> SqliteRepository::ListReferencedHashes(Transaction& t) {
  Statement st(TX(t).Handle(), sql::SELECT_REFERENCED_HASHES);
  SqliteRow row(st.get());
  std::vector<std::string> out;
  while (st.StepRow()) out.push_back(row.GetText(0));
  return out;
}

bool SqliteRepository::IsHashReferenced(Transaction& t, const std::string& content_hash) {
  Statement st(TX(t).Handle(), sql::SELECT_HASH_REFERENCED);
  BindText(st.get(), 1, content_hash);
  return st.StepRow();
}

} // namespace registry::db::sqlite
