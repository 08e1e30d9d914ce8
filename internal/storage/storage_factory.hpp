#pragma once

#include <memory>

#include "blob_store.hpp"
#include "config/config.pb.h"

namespace registry::storage {

/*
  Builds the configured blob store.

      auto blobs = StorageFactory::Build(config.storage(), clock);
      auto hash  = blobs->Put(source);
*/

class StorageFactory {
public:
  static BlobStorePtr Build(const registry::runtime::config::StorageConfig& cfg, std::shared_ptr<util::Clock> clock);
};

} // namespace registry::storage
