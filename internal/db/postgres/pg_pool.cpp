#include "pg_pool.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace registry::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto* conn = new pqxx::connection(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn);
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_entry",
               "INSERT INTO catalog_entry(" REGISTRY_ENTRY_COLUMNS ") "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11)");

  conn.prepare("get_entry", "SELECT " REGISTRY_ENTRY_COLUMNS " FROM catalog_entry WHERE id=$1");

  conn.prepare("find_live_entry",
               "SELECT " REGISTRY_ENTRY_COLUMNS " FROM catalog_entry "
               "WHERE name=$1 AND version=$2 AND state<>3");

  conn.prepare("list_entries_by_name",
               "SELECT " REGISTRY_ENTRY_COLUMNS " FROM catalog_entry WHERE name=$1 ORDER BY created_at_ms");

  conn.prepare("list_entries_by_state",
               "SELECT " REGISTRY_ENTRY_COLUMNS " FROM catalog_entry "
               "WHERE state=$1 AND updated_at_ms<$2 ORDER BY updated_at_ms");

  conn.prepare("list_package_names", "SELECT DISTINCT name FROM catalog_entry WHERE state=2 ORDER BY name");

  conn.prepare("update_entry",
               "UPDATE catalog_entry SET content_hash=$2,size_bytes=$3,state=$4,uploader=$5,"
               "updated_at_ms=$6,delete_reason=$7,download_count=$8 WHERE id=$1");

  conn.prepare("delete_entry", "DELETE FROM catalog_entry WHERE id=$1");

  conn.prepare("increment_downloads", "UPDATE catalog_entry SET download_count=download_count+1 WHERE id=$1");

  conn.prepare("referenced_hashes", "SELECT DISTINCT content_hash FROM catalog_entry");

  conn.prepare("hash_referenced", "SELECT 1 FROM catalog_entry WHERE content_hash=$1 LIMIT 1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace registry::db::postgres
