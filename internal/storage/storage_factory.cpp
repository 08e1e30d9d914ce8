#include "storage_factory.hpp"

#include <filesystem>

#include "disk/disk_blob_store.hpp"
#include "internal/observability/logging.hpp"
#include "memory/memory_blob_store.hpp"

namespace registry::storage {

BlobStorePtr StorageFactory::Build(const registry::runtime::config::StorageConfig& cfg, std::shared_ptr<util::Clock> clock) {
  const auto chunk_bytes = static_cast<std::size_t>(cfg.read_chunk_bytes());

  if (cfg.has_memory()) {
    REGISTRY_LOG_INFO("blob store: memory");
    return std::make_shared<MemoryBlobStore>(std::move(clock), chunk_bytes);
  }

  std::filesystem::path root = cfg.disk().root_path().empty() ? std::filesystem::path{"./storage"} : std::filesystem::path{cfg.disk().root_path()};
  REGISTRY_LOG_INFO("blob store: disk", {observability::StringField("root", root.string()), observability::BoolField("fsync", cfg.disk().fsync())});
  return std::make_shared<DiskBlobStore>(std::move(root), cfg.disk().fsync(), chunk_bytes);
}

} // namespace registry::storage
