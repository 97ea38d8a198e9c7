#pragma once

#include <mutex>
#include <unordered_map>

#include "internal/cache/kv_cache.hpp"
#include "internal/util/time.hpp"

namespace hsm::cache {

/*
  In-process cache. Shared by every thread of one process only; use the
  database cache when several processes sweep the same records.
*/
class MemoryCache final : public KeyValueCache {
 public:
  bool Add(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;

  void Delete(const std::string& key) override;

  std::optional<std::string> Get(const std::string& key) override;

  std::size_t Size();

 private:
  struct Entry {
    std::string           value;
    util::SteadyTimePoint expires_at;
  };

  static bool IsExpired(const Entry& entry, util::SteadyTimePoint now);

  void PurgeExpired(util::SteadyTimePoint now);

  std::mutex                             mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace hsm::cache
