#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace registry::db::sqlite {

/*
  Catalog transaction on the single SQLite connection.

  BEGIN IMMEDIATE takes the database write lock up front, so a reservation
  never fails halfway on SQLITE_BUSY after reading. The connection's
  transaction mutex is held for the lifetime of this object: a second Begin()
  on the same thread blocks.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::mutex> lock_;
  bool committed_ = false;
  bool finished_ = false;
};

} // namespace registry::db::sqlite
