#include "sqlite_cache.hpp"

#include <stdexcept>

#include "internal/util/time.hpp"
#include "sqlite_tx.hpp"

namespace hsm::db::sqlite {

namespace {

void Check(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

uint64_t NowMs() {
  return util::ToUnixMillis(util::Now());
}

} // namespace

SqliteCache::SqliteCache(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  if (!db_) throw std::invalid_argument("SqliteCache requires a database");
}

bool SqliteCache::Add(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
  SqliteTransaction tx(db_);
  auto*             db  = tx.Handle();
  const uint64_t    now = NowMs();

  {
    Statement purge(db, "DELETE FROM hsm_cache WHERE key=? AND expires_at_ms<=?;");
    if (!purge) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    purge.BindText(1, key);
    purge.BindU64(2, now);
    Check(purge.Step(), db, "hsm_cache purge");
  }

  {
    Statement insert(db, "INSERT OR IGNORE INTO hsm_cache(key,value,expires_at_ms) VALUES(?,?,?);");
    if (!insert) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    insert.BindText(1, key);
    insert.BindText(2, value);
    insert.BindU64(3, now + static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(ttl).count()));
    Check(insert.Step(), db, "hsm_cache insert");
  }

  const bool stored = sqlite3_changes(db) > 0;
  tx.Commit();
  return stored;
}

void SqliteCache::Delete(const std::string& key) {
  SqliteTransaction tx(db_);
  auto*             db = tx.Handle();

  Statement st(db, "DELETE FROM hsm_cache WHERE key=?;");
  if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  st.BindText(1, key);
  Check(st.Step(), db, "hsm_cache delete");
  tx.Commit();
}

std::optional<std::string> SqliteCache::Get(const std::string& key) {
  SqliteTransaction tx(db_);
  auto*             db = tx.Handle();

  std::optional<std::string> value;
  {
    Statement st(db, "SELECT value FROM hsm_cache WHERE key=? AND expires_at_ms>?;");
    if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    st.BindText(1, key);
    st.BindU64(2, NowMs());

    int rc = st.Step();
    if (rc == SQLITE_ROW) {
      value = st.ColText(0);
    } else {
      Check(rc, db, "hsm_cache get");
    }
  }
  tx.Commit();
  return value;
}

} // namespace hsm::db::sqlite
