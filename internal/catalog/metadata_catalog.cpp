#include "metadata_catalog.hpp"

#include <limits>
#include <map>
#include <stdexcept>

#include "internal/model/artifact.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "internal/version/version_range.hpp"

namespace registry::catalog {

namespace {

using registry::v1::ENTRY_STATE_DELETED;
using registry::v1::ENTRY_STATE_PENDING;
using registry::v1::ENTRY_STATE_PUBLISHED;

constexpr int kBeginPublishAttempts = 3;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + ": " + (result.message.empty() ? db::ToString(result.code) : result.message);
  if (result.Retryable()) {
    throw util::TransientStorageError(message);
  }
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::ConstraintViolation:
      throw util::Conflict(message);
    default:
      throw std::runtime_error(message);
  }
}

std::string Coordinate(const std::string& name, const std::string& version) {
  return name + "@" + version;
}

} // namespace

MetadataCatalog::MetadataCatalog(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                                 std::shared_ptr<EntryCache> cache, CatalogOptions options)
    : repository_(std::move(repository)),
      clock_(clock ? std::move(clock) : std::make_shared<util::WallClock>()),
      cache_(cache ? std::move(cache) : std::make_shared<EntryCache>()),
      options_(options) {
}

Reservation MetadataCatalog::BeginPublish(const std::string& raw_name, const std::string& raw_version, uint64_t expected_size,
                                          const std::string& raw_hash, const std::string& uploader) {
  const auto name    = model::NormalizeName(raw_name);
  const auto version = model::NormalizeVersion(raw_version);
  const auto hash    = util::NormalizeContentHash(raw_hash);

  // A lost insert race is resolved by re-reading the winner.
  for (int attempt = 0; attempt < kBeginPublishAttempts; ++attempt) {
    auto tx = repository_->Begin();

    if (auto live = repository_->FindLiveEntry(*tx, name, version)) {
      if (live->content_hash != hash) {
        throw util::Conflict(Coordinate(name, version) + " is already " + model::StateName(live->state) + " with content " +
                             live->content_hash);
      }
      tx->Commit();
      return Reservation{live->id, live->state, false};
    }

    if (options_.block_reuse_of_deleted) {
      for (const auto& row : repository_->ListEntriesByName(*tx, name)) {
        if (row.version == version && row.state == ENTRY_STATE_DELETED) {
          throw util::Conflict(Coordinate(name, version) + " was deleted and stays reserved until purged");
        }
      }
    }

    const auto now_ms = util::ToUnixMillis(clock_->Now());

    CatalogEntryRecord record;
    record.id            = util::GenerateUUIDString();
    record.name          = name;
    record.version       = version;
    record.content_hash  = hash;
    record.size_bytes    = expected_size;
    record.state         = ENTRY_STATE_PENDING;
    record.uploader      = uploader;
    record.created_at_ms = now_ms;
    record.updated_at_ms = now_ms;

    auto result = repository_->InsertEntry(*tx, record);
    if (result.code == db::ErrorCode::ConstraintViolation) {
      tx->Rollback();
      continue;
    }
    ThrowIfDbError(result, "insert " + Coordinate(name, version));
    tx->Commit();

    REGISTRY_LOG_DEBUG("publish reserved", {observability::EntryField(record.id),
                                            observability::ArtifactField(name, version),
                                            observability::HashField(hash)});
    return Reservation{record.id, ENTRY_STATE_PENDING, true};
  }

  throw util::TransientStorageError("could not reserve " + Coordinate(name, version) + ": concurrent writers");
}

CatalogEntryRecord MetadataCatalog::CommitPublish(const std::string& entry_id) {
  const auto generation = cache_->Generation();
  auto       tx         = repository_->Begin();
  auto record = repository_->GetEntry(*tx, entry_id);
  if (!record) throw util::NotFound("entry " + entry_id + " not found");
  if (!model::CanTransition(record->state, ENTRY_STATE_PUBLISHED)) {
    throw util::InvalidState("entry " + entry_id + " is " + model::StateName(record->state) + ", not pending");
  }

  record->state         = ENTRY_STATE_PUBLISHED;
  record->updated_at_ms = util::ToUnixMillis(clock_->Now());
  ThrowIfDbError(repository_->UpdateEntry(*tx, *record), "commit " + entry_id);
  tx->Commit();

  cache_->PutIfGeneration(*record, generation);
  return *record;
}

void MetadataCatalog::AbortPublish(const std::string& entry_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetEntry(*tx, entry_id);
  if (!record) throw util::NotFound("entry " + entry_id + " not found");
  if (record->state != ENTRY_STATE_PENDING) {
    throw util::InvalidState("entry " + entry_id + " is " + model::StateName(record->state) + ", cannot abort");
  }

  ThrowIfDbError(repository_->DeleteEntry(*tx, entry_id), "abort " + entry_id);
  tx->Commit();

  cache_->Invalidate(record->name, record->version);
  REGISTRY_LOG_INFO("publish aborted", {observability::EntryField(entry_id),
                                        observability::ArtifactField(record->name, record->version)});
}

CatalogEntryRecord MetadataCatalog::Resolve(const std::string& raw_name, const std::string& version_or_range) {
  const auto name = model::NormalizeName(raw_name);

  if (version::IsExactVersion(version_or_range)) {
    const auto version = model::NormalizeVersion(version_or_range);
    if (auto cached = cache_->Get(name, version)) return *cached;

    const auto generation = cache_->Generation();
    auto       tx         = repository_->Begin();
    auto live = repository_->FindLiveEntry(*tx, name, version);
    tx->Commit();
    if (!live || live->state != ENTRY_STATE_PUBLISHED) {
      throw util::NotFound(Coordinate(name, version) + " not found");
    }
    cache_->PutIfGeneration(*live, generation);
    return *live;
  }

  const auto range = version::VersionRange::Parse(version_or_range);

  auto tx   = repository_->Begin();
  auto rows = repository_->ListEntriesByName(*tx, name);
  tx->Commit();

  std::map<std::string, CatalogEntryRecord> published;
  std::vector<version::Version>             candidates;
  for (auto& row : rows) {
    if (row.state != ENTRY_STATE_PUBLISHED) continue;
    auto parsed = version::Version::Parse(row.version);
    if (!parsed) continue;
    published.emplace(parsed->str(), std::move(row));
    candidates.push_back(std::move(*parsed));
  }

  auto best = version::SelectHighest(range, candidates);
  if (!best) throw util::NotFound("no published version of " + name + " matches '" + range.str() + "'");
  return published.at(best->str());
}

std::optional<CatalogEntryRecord> MetadataCatalog::GetEntry(const std::string& entry_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetEntry(*tx, entry_id);
  tx->Commit();
  return record;
}

std::vector<std::string> MetadataCatalog::ListVersions(const std::string& raw_name) {
  const auto name = model::NormalizeName(raw_name);

  auto tx   = repository_->Begin();
  auto rows = repository_->ListEntriesByName(*tx, name);
  tx->Commit();

  std::vector<version::Version> versions;
  for (const auto& row : rows) {
    if (row.state != ENTRY_STATE_PUBLISHED) continue;
    if (auto parsed = version::Version::Parse(row.version)) versions.push_back(*parsed);
  }
  if (versions.empty()) throw util::NotFound("package " + name + " not found");

  version::SortDescending(&versions);
  std::vector<std::string> out;
  out.reserve(versions.size());
  for (const auto& v : versions) out.push_back(v.str());
  return out;
}

std::vector<std::string> MetadataCatalog::ListPackages() {
  auto tx    = repository_->Begin();
  auto names = repository_->ListPackageNames(*tx);
  tx->Commit();
  return names;
}

CatalogEntryRecord MetadataCatalog::SoftDelete(const std::string& raw_name, const std::string& raw_version, const std::string& reason) {
  const auto name    = model::NormalizeName(raw_name);
  const auto version = model::NormalizeVersion(raw_version);

  auto tx   = repository_->Begin();
  auto live = repository_->FindLiveEntry(*tx, name, version);
  if (!live || live->state != ENTRY_STATE_PUBLISHED) {
    throw util::NotFound(Coordinate(name, version) + " not found");
  }

  live->state         = ENTRY_STATE_DELETED;
  live->delete_reason = reason;
  live->updated_at_ms = util::ToUnixMillis(clock_->Now());
  ThrowIfDbError(repository_->UpdateEntry(*tx, *live), "delete " + Coordinate(name, version));
  tx->Commit();

  cache_->Invalidate(name, version);
  REGISTRY_LOG_INFO("artifact deleted", {observability::ArtifactField(name, version),
                                         observability::HashField(live->content_hash),
                                         observability::StringField("reason", reason)});
  return *live;
}

std::vector<std::string> MetadataCatalog::DeletePackage(const std::string& raw_name, const std::string& reason) {
  const auto name = model::NormalizeName(raw_name);

  std::vector<std::string> deleted;
  auto                     tx     = repository_->Begin();
  const auto               now_ms = util::ToUnixMillis(clock_->Now());
  for (auto& row : repository_->ListEntriesByName(*tx, name)) {
    if (row.state != ENTRY_STATE_PUBLISHED) continue;
    row.state         = ENTRY_STATE_DELETED;
    row.delete_reason = reason;
    row.updated_at_ms = now_ms;
    ThrowIfDbError(repository_->UpdateEntry(*tx, row), "delete " + Coordinate(name, row.version));
    deleted.push_back(row.version);
  }
  if (deleted.empty()) throw util::NotFound("package " + name + " not found");
  tx->Commit();

  cache_->InvalidateName(name);
  REGISTRY_LOG_INFO("package deleted", {observability::StringField("package", name),
                                        observability::IntField("versions", static_cast<int64_t>(deleted.size())),
                                        observability::StringField("reason", reason)});
  return deleted;
}

uint32_t MetadataCatalog::Purge(const std::string& raw_name, const std::string& raw_version) {
  const auto name    = model::NormalizeName(raw_name);
  const auto version = model::NormalizeVersion(raw_version);

  uint32_t purged = 0;
  auto     tx     = repository_->Begin();
  for (const auto& row : repository_->ListEntriesByName(*tx, name)) {
    if (row.version != version || row.state != ENTRY_STATE_DELETED) continue;
    ThrowIfDbError(repository_->DeleteEntry(*tx, row.id), "purge " + row.id);
    ++purged;
  }
  if (purged == 0) throw util::NotFound("no deleted entry for " + Coordinate(name, version));
  tx->Commit();

  REGISTRY_LOG_INFO("artifact purged",
                    {observability::ArtifactField(name, version), observability::IntField("rows", purged)});
  return purged;
}

uint32_t MetadataCatalog::PurgeDeleted(util::TimePoint older_than) {
  uint32_t purged = 0;
  auto     tx     = repository_->Begin();
  for (const auto& row : repository_->ListEntriesByState(*tx, ENTRY_STATE_DELETED, util::ToUnixMillis(older_than))) {
    ThrowIfDbError(repository_->DeleteEntry(*tx, row.id), "purge " + row.id);
    ++purged;
  }
  tx->Commit();

  if (purged > 0) {
    REGISTRY_LOG_INFO("deleted entries purged", {observability::IntField("rows", purged)});
  }
  return purged;
}

std::vector<CatalogEntryRecord> MetadataCatalog::ListStalePending(util::TimePoint older_than) {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListEntriesByState(*tx, ENTRY_STATE_PENDING, util::ToUnixMillis(older_than));
  tx->Commit();
  return rows;
}

std::vector<std::string> MetadataCatalog::ListReferencedHashes() {
  auto tx     = repository_->Begin();
  auto hashes = repository_->ListReferencedHashes(*tx);
  tx->Commit();
  return hashes;
}

bool MetadataCatalog::IsHashReferenced(const std::string& content_hash) {
  auto       tx         = repository_->Begin();
  const bool referenced = repository_->IsHashReferenced(*tx, content_hash);
  tx->Commit();
  return referenced;
}

void MetadataCatalog::RecordDownload(const std::string& entry_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetEntry(*tx, entry_id);
  if (!record) throw util::NotFound("entry " + entry_id + " not found");
  ThrowIfDbError(repository_->IncrementDownloadCount(*tx, entry_id), "record download " + entry_id);
  tx->Commit();

  cache_->RecordDownload(record->name, record->version);
}

std::size_t MetadataCatalog::HydrateCache() {
  const auto generation = cache_->Generation();
  auto       tx         = repository_->Begin();
  auto published = repository_->ListEntriesByState(*tx, ENTRY_STATE_PUBLISHED, static_cast<uint64_t>(std::numeric_limits<int64_t>::max()));
  tx->Commit();

  if (!cache_->Hydrate(published, generation)) {
    REGISTRY_LOG_WARN("entry cache hydration raced a catalog mutation; serving from the catalog",
                      {observability::IntField("entries", static_cast<int64_t>(published.size()))});
    return 0;
  }
  REGISTRY_LOG_INFO("entry cache hydrated", {observability::IntField("entries", static_cast<int64_t>(published.size()))});
  return published.size();
}

} // namespace registry::catalog
