#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace acquisition::util {

/*
  UUID helpers

  Job ids are RFC4122 v4 UUIDs in their canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string GenerateJobId() {
  return ToString(GenerateUUID());
}

} // namespace acquisition::util
