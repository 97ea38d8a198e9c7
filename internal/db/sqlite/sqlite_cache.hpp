#pragma once

#include <memory>

#include "internal/cache/kv_cache.hpp"
#include "sqlite_db.hpp"

namespace hsm::db::sqlite {

/*
  KeyValueCache stored in the hsm_cache table.

  Every process opening the same database file shares the entries, so
  advisory locks taken through it exclude other sweep and ingest
  processes too. Expiry uses wall-clock epoch milliseconds.
*/
class SqliteCache final : public cache::KeyValueCache {
 public:
  explicit SqliteCache(std::shared_ptr<SqliteDB> db);

  bool Add(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;

  void Delete(const std::string& key) override;

  std::optional<std::string> Get(const std::string& key) override;

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace hsm::db::sqlite
