#include "memory_cache.hpp"

namespace hsm::cache {

bool MemoryCache::IsExpired(const Entry& entry, util::SteadyTimePoint now) {
  return entry.expires_at <= now;
}

void MemoryCache::PurgeExpired(util::SteadyTimePoint now) {
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (IsExpired(it->second, now)) {
      it = entries_.erase(it);
      continue;
    }
    ++it;
  }
}

bool MemoryCache::Add(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
  std::lock_guard lock(mutex_);

  const auto now = util::SteadyNow();
  PurgeExpired(now);

  if (entries_.count(key) != 0) {
    return false;
  }

  entries_.emplace(key, Entry{value, now + ttl});
  return true;
}

void MemoryCache::Delete(const std::string& key) {
  std::lock_guard lock(mutex_);
  entries_.erase(key);
}

std::optional<std::string> MemoryCache::Get(const std::string& key) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  if (IsExpired(it->second, util::SteadyNow())) {
    entries_.erase(it);
    return std::nullopt;
  }
  return it->second.value;
}

std::size_t MemoryCache::Size() {
  std::lock_guard lock(mutex_);
  PurgeExpired(util::SteadyNow());
  return entries_.size();
}

} // namespace hsm::cache
