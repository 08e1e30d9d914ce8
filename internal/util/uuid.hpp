#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace registry::util {

/*
  UUID helpers

  Catalog entry ids are random RFC4122 v4 UUIDs in canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

inline std::string GenerateUUIDString() {
  return ToString(GenerateUUID());
}

} // namespace registry::util
