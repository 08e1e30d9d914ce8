#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace registry::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction, so transactions are
  serialized on TxMutex() for their whole lifetime.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/schema/transaction control).
  // SQLITE_BUSY and SQLITE_LOCKED raise TransientStorageError.
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure(bool wal_mode);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace registry::db::sqlite
