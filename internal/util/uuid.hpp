#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace hsm::util {

/*
  UUID helpers

  Raw 16 byte RFC4122 version 4 UUIDs, used for lock owner ids.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// "<prefix>-<uuid>", unique per call.
std::string GenerateOwnerId(const std::string& prefix);

} // namespace hsm::util
