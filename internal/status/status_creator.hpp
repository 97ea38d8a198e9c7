#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/cache/kv_cache.hpp"
#include "internal/status/online_status.hpp"
#include "internal/status/status_store.hpp"

namespace hsm::status {

enum class CreateStatusOutcome {
  kCreated,
  kAlreadyExists,
  kLockNotAcquired,
  kUnverified,
  kFileNotFound,
};

const char* CreateStatusOutcomeName(CreateStatusOutcome outcome);

struct CreateStatusResult {
  CreateStatusOutcome outcome = CreateStatusOutcome::kAlreadyExists;

  // persisted value, set for kCreated only
  std::optional<bool> created_value;

  bool Created() const {
    return outcome == CreateStatusOutcome::kCreated;
  }
};

struct BackfillReport {
  uint64_t created           = 0;
  uint64_t already_exists    = 0;
  uint64_t lock_not_acquired = 0;
  uint64_t failed            = 0;
};

struct LockSettings {
  std::chrono::seconds ttl;
  std::chrono::seconds safety_margin;
};

/*
  Writes the first status record of a tracked file.

      unverified          -> kUnverified (warning, nothing written)
      record exists       -> kAlreadyExists
      lock busy           -> kLockNotAcquired
      otherwise           -> check online under the lock, persist "True"/"False"

  Existence is checked again once the lock is held, and a duplicate insert
  that still slips through maps to kAlreadyExists, so repeated and
  concurrent calls leave exactly one record.

  Probe, storage-class and backend configuration errors propagate to the
  caller after the lock has been released.
*/
class StatusCreator {
 public:
  StatusCreator(std::shared_ptr<db::Repository> repository, std::shared_ptr<StatusStore> store, std::shared_ptr<OnlineStatus> online,
                cache::KeyValueCachePtr lock_cache, LockSettings locks);

  CreateStatusResult CreateStatus(const std::string& file_id, const std::string& namespace_uri);

  /*
    Creates records for every verified tracked file that has none. Per-file
    errors are logged and counted; they do not stop the run.
  */
  BackfillReport Backfill(const std::string& namespace_uri);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<StatusStore>    store_;
  std::shared_ptr<OnlineStatus>   online_;
  cache::KeyValueCachePtr         lock_cache_;
  LockSettings                    locks_;
};

} // namespace hsm::status
