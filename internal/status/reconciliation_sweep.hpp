#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/cache/kv_cache.hpp"
#include "internal/status/online_status.hpp"
#include "internal/status/status_creator.hpp"
#include "internal/status/status_store.hpp"

namespace hsm::status {

inline constexpr std::size_t kDefaultSweepBatchSize = 256;

struct SweepReport {
  uint64_t candidates      = 0;
  uint64_t unchanged       = 0;
  uint64_t flipped_offline = 0;
  uint64_t skipped         = 0;
  uint64_t skipped_locked  = 0;
  uint64_t failed          = 0;
};

/*
  Periodic reconciliation of stored status against the filesystem.

  Only records currently reading "True" are candidates; they are read in
  keyset pages of `batch_size`. For each page every eligible candidate is
  locked and dispatched to its checker, then the page's results are
  collected:

      offline  -> record re-read, flipped to "False" if still "True"
      online   -> no write
      failure  -> logged, counted, sweep continues

  Ineligible candidates (missing/unverified file, unsupported storage
  class, no location, ambiguous backend config, lock held elsewhere) are
  skipped. A missing namespace schema is the only fatal condition and is
  thrown as util::NotFound before anything is read.
*/
class ReconciliationSweep {
 public:
  ReconciliationSweep(std::shared_ptr<StatusStore> store, std::shared_ptr<OnlineStatus> online, cache::KeyValueCachePtr lock_cache,
                      LockSettings locks, std::size_t batch_size = kDefaultSweepBatchSize);

  SweepReport Run(const std::string& namespace_uri);

 private:
  std::shared_ptr<StatusStore>  store_;
  std::shared_ptr<OnlineStatus> online_;
  cache::KeyValueCachePtr       lock_cache_;
  LockSettings                  locks_;
  std::size_t                   batch_size_;
};

} // namespace hsm::status
