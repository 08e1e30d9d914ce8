#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace registry::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  try {
    conn_ = pool->Acquire();
  } catch (const pqxx::broken_connection& e) {
    throw util::TransientStorageError(std::string("postgres connect: ") + e.what());
  }
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      REGISTRY_LOG_WARN("postgres rollback failed", {observability::ErrorField(e.what())});
    }
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    finished_ = true;
    throw util::TransientStorageError(std::string("postgres commit: ") + e.what());
  } catch (const pqxx::broken_connection& e) {
    finished_ = true;
    throw util::TransientStorageError(std::string("postgres commit: ") + e.what());
  }
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
  finished_ = true;
}

} // namespace registry::db::postgres
