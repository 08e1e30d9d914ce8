#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace registry::db::postgres {

/*
  Bounded pool of catalog connections.

  - One connection per PgTransaction, returned to the pool when the
    transaction releases it.
  - Acquire() blocks once max_connections are checked out.
  - The catalog statements (insert_entry, find_live_entry, ...) are prepared
    once per connection when it is opened.
  - A pool destroyed while connections are out closes them on release.
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Idle connection, a freshly opened one, or blocks until one is released.
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace registry::db::postgres
