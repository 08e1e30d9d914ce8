#pragma once

namespace registry::db {

/*
  Unit of work over the catalog.

  Every MetadataCatalog operation opens one, reads and writes through the
  Repository, then commits. Guarantees on every backend:

  - writes are invisible to other transactions until Commit()
  - reads inside the transaction see its own writes
  - Rollback(), or destruction without Commit(), discards the writes
  - Commit() may throw TransientStorageError when a concurrent writer won;
    the whole operation is then retried from Begin()

  Isolation per backend:
    SQLite    BEGIN IMMEDIATE, one writer per connection
    Postgres  pqxx::work, read committed, unique index arbitrates inserts
    Memory    snapshot copy, optimistic version check at commit
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace registry::db
