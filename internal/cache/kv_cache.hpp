#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace hsm::cache {

/*
  Shared key-value cache with per-entry TTL.

  Add() is the only synchronisation primitive: it stores the entry only if
  no unexpired entry exists for the key, atomically with respect to every
  other caller of the same cache. Advisory locks are built on it.
*/
class KeyValueCache {
 public:
  virtual ~KeyValueCache() = default;

  // true iff the entry was stored.
  virtual bool Add(const std::string& key, const std::string& value, std::chrono::seconds ttl) = 0;

  virtual void Delete(const std::string& key) = 0;

  // Unexpired value for key.
  virtual std::optional<std::string> Get(const std::string& key) = 0;
};

using KeyValueCachePtr = std::shared_ptr<KeyValueCache>;

} // namespace hsm::cache
