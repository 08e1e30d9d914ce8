#include "pg_repository.hpp"

#include "internal/db/sql/sql_row.hpp"
#include "internal/util/errors.hpp"

namespace registry::db::postgres {

namespace {

class PgRow final : public sql::Row {
public:
  explicit PgRow(const pqxx::row& row) : row_(row) {}

  std::string GetText(int col) const override { return row_[col].is_null() ? std::string() : row_[col].c_str(); }
  int GetInt(int col) const override { return row_[col].as<int>(); }
  int64_t GetInt64(int col) const override { return row_[col].as<int64_t>(); }
  bool IsNull(int col) const override { return row_[col].is_null(); }

private:
  const pqxx::row& row_;
};

std::vector<model::CatalogEntryRecord> CollectEntries(const pqxx::result& res) {
  std::vector<model::CatalogEntryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(sql::ReadEntryRow(PgRow(row)));
  return out;
}

// Read paths: connection loss is retryable, everything else propagates.
template <typename Fn>
auto ReadGuard(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::broken_connection& e) {
    throw util::TransientStorageError(std::string("postgres: ") + e.what());
  } catch (const pqxx::serialization_failure& e) {
    throw util::TransientStorageError(std::string("postgres: ") + e.what());
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::Busy, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertEntry(Transaction& t, const model::CatalogEntryRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_entry", r.id, r.name, r.version, r.content_hash, static_cast<int64_t>(r.size_bytes),
                               static_cast<int>(r.state), r.uploader, static_cast<int64_t>(r.created_at_ms),
                               static_cast<int64_t>(r.updated_at_ms), r.delete_reason,
                               static_cast<int64_t>(r.download_count));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CatalogEntryRecord> PgRepository::GetEntry(Transaction& t, const std::string& id) {
  return ReadGuard([&]() -> std::optional<model::CatalogEntryRecord> {
    auto res = TX(t).Work().exec_prepared("get_entry", id);
    if (res.empty()) return std::nullopt;
    return sql::ReadEntryRow(PgRow(res[0]));
  });
}

std::optional<model::CatalogEntryRecord> PgRepository::FindLiveEntry(Transaction& t, const std::string& name,
                                                                      const std::string& version) {
  return ReadGuard([&]() -> std::optional<model::CatalogEntryRecord> {
    auto res = TX(t).Work().exec_prepared("find_live_entry", name, version);
    if (res.empty()) return std::nullopt;
    return sql::ReadEntryRow(PgRow(res[0]));
  });
}

std::vector<model::CatalogEntryRecord> PgRepository::ListEntriesByName(Transaction& t, const std::string& name) {
  return ReadGuard([&] { return CollectEntries(TX(t).Work().exec_prepared("list_entries_by_name", name)); });
}

std::vector<model::CatalogEntryRecord> PgRepository::ListEntriesByState(Transaction& t, registry::v1::EntryState state,
                                                                        uint64_t updated_before_ms) {
  return ReadGuard([&] {
    return CollectEntries(TX(t).Work().exec_prepared("list_entries_by_state", static_cast<int>(state),
                                                     static_cast<int64_t>(updated_before_ms)));
  });
}

std::vector<std::string> PgRepository::ListPackageNames(Transaction& t) {
  return ReadGuard([&] {
    std::vector<std::string> out;
    for (const auto& row : TX(t).Work().exec_prepared("list_package_names")) out.emplace_back(row[0].c_str());
    return out;
  });
}

Result PgRepository::UpdateEntry(Transaction& t, const model::CatalogEntryRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_entry", r.id, r.content_hash, static_cast<int64_t>(r.size_bytes),
                                          static_cast<int>(r.state), r.uploader, static_cast<int64_t>(r.updated_at_ms),
                                          r.delete_reason, static_cast<int64_t>(r.download_count));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteEntry(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_prepared("delete_entry", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::IncrementDownloadCount(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("increment_downloads", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<std::string> PgRepository::ListReferencedHashes(Transaction& t) {
  return ReadGuard([&] {
    std::vector<std::string> out;
    for (const auto& row : TX(t).Work().exec_prepared("referenced_hashes")) out.emplace_back(row[0].c_str());
    return out;
  });
}

bool PgRepository::IsHashReferenced(Transaction& t, const std::string& content_hash) {
  return ReadGuard([&] { return !TX(t).Work().exec_prepared("hash_referenced", content_hash).empty(); });
}

} // namespace registry::db::postgres
