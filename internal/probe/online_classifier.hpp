#pragma once

#include <cstdint>

namespace hsm::probe {

/*
  Online/offline classification from stat() output.

  A file larger than the inline-data threshold that has no allocated blocks
  is a tape placeholder: its content has been migrated off disk. Files at or
  below the threshold can live entirely in the inode and legitimately report
  zero blocks, so they are always considered online.

  The threshold is deployment specific (inline capacity differs between
  filesystems); 350 bytes is only the fallback when nothing is configured.
*/
inline constexpr uint64_t kDefaultMinFileSizeBytes = 350;

constexpr bool Classify(uint64_t size_bytes, uint64_t allocated_blocks, uint64_t min_file_size_bytes) noexcept {
  return !(size_bytes > min_file_size_bytes && allocated_blocks == 0);
}

struct ProbeResult {
  uint64_t size_bytes       = 0;
  uint64_t allocated_blocks = 0;
};

inline bool IsOnline(const ProbeResult& result, uint64_t min_file_size_bytes) noexcept {
  return Classify(result.size_bytes, result.allocated_blocks, min_file_size_bytes);
}

} // namespace hsm::probe
