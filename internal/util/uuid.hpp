#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace convintel::util {

/*
  UUID helpers

  Run ids and generated record ids are RFC4122 v4 UUIDs rendered as text.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

inline std::string GenerateUUIDString() {
  return ToString(GenerateUUID());
}

} // namespace convintel::util
