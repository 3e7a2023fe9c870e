#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace runvault::db::sqlite {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

/*
  One sqlite3 connection.

  A file may back several stores (run, event log, instigator all pointing
  at the same path); they share this handle and serialize their
  transactions through TxMutex().
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

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  bool InMemory() const {
    return path_ == ":memory:";
  }

  // Transaction control and pragmas. Throws on failure.
  void Exec(const std::string& sql);

  // Returns the sqlite result code; `out` is set only on SQLITE_OK.
  int Prepare(const std::string& sql, StmtPtr* out) const;

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace runvault::db::sqlite
