#include "sqlite_tx.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace runvault::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode)
    : db_(std::move(db)), guard_(db_->TxMutex()) {
  // writers take the file write lock now rather than on the first write
  db_->Exec(mode == TxMode::kWrite ? "BEGIN IMMEDIATE;" : "BEGIN;");
  open_ = true;
}

SqliteTransaction::~SqliteTransaction() {
  if (!open_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    RUNVAULT_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (!open_) {
    throw std::logic_error("sqlite transaction already committed");
  }
  open_ = false;
  try {
    db_->Exec("COMMIT;");
  } catch (const std::exception&) {
    // a failed COMMIT can leave sqlite inside the transaction
    if (sqlite3_get_autocommit(db_->Handle()) == 0) {
      int rc = sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
      if (rc != SQLITE_OK) {
        RUNVAULT_LOG_WARN("sqlite rollback after failed commit", {observability::StringField("error", sqlite3_errstr(rc))});
      }
    }
    guard_.unlock();
    throw;
  }
  // the handle is free for the next transaction even while this object lives
  guard_.unlock();
}

} // namespace runvault::db::sqlite
