#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace runvault::db::sqlite {

// Owns the handle's TxMutex until committed or destroyed. Never open a
// second one on the same handle while the first is still open.
class SqliteTransaction final : public db::Transaction {
 public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode);
  ~SqliteTransaction() override;

  SqliteDB& Db() {
    return *db_;
  }

  void Commit() override;

 private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> guard_;
  bool                         open_ = false;
};

} // namespace runvault::db::sqlite
