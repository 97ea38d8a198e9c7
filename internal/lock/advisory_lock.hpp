#pragma once

#include <chrono>
#include <string>

#include "internal/cache/kv_cache.hpp"
#include "internal/util/time.hpp"

namespace hsm::lock {

inline constexpr std::chrono::seconds kDefaultLockTtl{300};
inline constexpr std::chrono::seconds kDefaultSafetyMargin{3};

/*
  Advisory, TTL-bounded lock over one tracked file.

  Throttles duplicate status work across workers; it is not a correctness
  guarantee. The token lives in a shared KeyValueCache under KeyFor(file_id)
  and expires on its own after `ttl`.

      AdvisoryLock lock(cache, AdvisoryLock::KeyFor(id), owner);
      if (!lock.Acquire()) return;   // someone else is on it
      ...                            // released on scope exit

  Release() only deletes the token while this owner is still inside its own
  window (acquisition time + ttl - safety_margin). Past that point the token
  may already belong to someone else, so it is left to expire.
*/
class AdvisoryLock {
 public:
  AdvisoryLock(cache::KeyValueCachePtr cache, std::string key, std::string owner_id,
               std::chrono::seconds ttl = kDefaultLockTtl, std::chrono::seconds safety_margin = kDefaultSafetyMargin);
  ~AdvisoryLock();

  AdvisoryLock(const AdvisoryLock&)            = delete;
  AdvisoryLock& operator=(const AdvisoryLock&) = delete;

  // true iff this owner now holds the lock.
  bool Acquire();

  void Release();

  bool Held() const {
    return held_;
  }

  explicit operator bool() const {
    return held_;
  }

  const std::string& OwnerId() const {
    return owner_id_;
  }

  // Stable across processes: "lock-" + file id.
  static std::string KeyFor(const std::string& file_id);

 private:
  cache::KeyValueCachePtr cache_;
  std::string             key_;
  std::string             owner_id_;
  std::chrono::seconds    ttl_;
  std::chrono::seconds    safety_margin_;

  bool                  held_ = false;
  util::SteadyTimePoint expires_at_{};
};

} // namespace hsm::lock
