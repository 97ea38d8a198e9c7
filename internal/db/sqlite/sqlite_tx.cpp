#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace hsm::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), guard_(db_->TransactionLock()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      HSM_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw util::InvalidState("transaction already finished");
  }
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
  guard_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  db_->Exec("ROLLBACK;");
  guard_.unlock();
}

} // namespace hsm::db::sqlite
