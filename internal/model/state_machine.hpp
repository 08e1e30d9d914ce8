#pragma once

#include "registry/v1/types.pb.h"

namespace registry::model {

using registry::v1::EntryState;

/*
  Catalog entry lifecycle:

    pending ──commit──> published ──soft delete──> deleted ──purge──> (row gone)
       └────abort────> (row gone)
*/

constexpr bool IsLive(EntryState state) {
  return state == registry::v1::ENTRY_STATE_PENDING || state == registry::v1::ENTRY_STATE_PUBLISHED;
}

constexpr bool CanTransition(EntryState from, EntryState to) {
  switch (from) {
    case registry::v1::ENTRY_STATE_PENDING:
      return to == registry::v1::ENTRY_STATE_PUBLISHED;
    case registry::v1::ENTRY_STATE_PUBLISHED:
      return to == registry::v1::ENTRY_STATE_DELETED;
    default:
      return false;
  }
}

inline const char* StateName(EntryState state) {
  switch (state) {
    case registry::v1::ENTRY_STATE_PENDING:
      return "pending";
    case registry::v1::ENTRY_STATE_PUBLISHED:
      return "published";
    case registry::v1::ENTRY_STATE_DELETED:
      return "deleted";
    default:
      return "unspecified";
  }
}

} // namespace registry::model
