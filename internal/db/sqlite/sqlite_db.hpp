#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace hsm::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  The connection is shared by every transaction in the process. SQLite
  allows one open transaction per connection, so SqliteTransaction holds
  TransactionLock() until it finishes. Cross-process writers are
  serialized by BEGIN IMMEDIATE and the busy timeout.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  std::unique_lock<std::mutex> TransactionLock() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

/*
  Owns a prepared statement and finalizes it on scope exit.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* Get() const {
    return stmt_;
  }

  // false when prepare failed; sqlite3_errmsg(db) has the reason
  explicit operator bool() const {
    return stmt_ != nullptr;
  }

  void BindText(int idx, const std::string& s);
  void BindU64(int idx, uint64_t v);
  void BindBool(int idx, bool v);

  int Step();

  std::string ColText(int col) const;
  uint64_t    ColU64(int col) const;
  bool        ColBool(int col) const;

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace hsm::db::sqlite
