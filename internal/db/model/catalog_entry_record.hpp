#pragma once

#include <cstdint>
#include <string>

#include "registry/v1/types.pb.h"

namespace registry::db::model {

/*
  Persistent catalog row.

  IMPORTANT:
  - This is the authoritative publication state machine record.
  - (name, version) is unique among rows that are not deleted.
  - content_hash is the blob store key (lowercase hex sha256).
*/

struct CatalogEntryRecord {
  std::string id; // UUID string

  std::string name;
  std::string version;

  std::string content_hash;
  uint64_t    size_bytes = 0;

  registry::v1::EntryState state = registry::v1::ENTRY_STATE_UNSPECIFIED;

  std::string uploader;

  uint64_t created_at_ms = 0;
  // Time of the last state transition.
  uint64_t updated_at_ms = 0;

  std::string delete_reason;
  uint64_t    download_count = 0;
};

} // namespace registry::db::model
