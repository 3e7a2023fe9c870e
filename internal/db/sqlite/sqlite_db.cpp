#include "sqlite_db.hpp"

#include <stdexcept>

namespace runvault::db::sqlite {

namespace {

// a backfill batch holds the write lock for a while; readers wait it out
constexpr int kBusyTimeoutMs = 10000;

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("open " + path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw std::runtime_error(path_ + ": " + sql + ": " + msg);
  }
}

int SqliteDB::Prepare(const std::string& sql, StmtPtr* out) const {
  sqlite3_stmt* raw = nullptr;
  int           rc  = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr);
  if (rc == SQLITE_OK) out->reset(raw);
  return rc;
}

void SqliteDB::Configure() {
  if (!InMemory()) {
    // readers of the event log keep going while a run appends
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  }

  // run_tags cascades from runs
  Exec("PRAGMA foreign_keys=ON;");

  if (int rc = sqlite3_busy_timeout(db_, kBusyTimeoutMs); rc != SQLITE_OK) {
    throw std::runtime_error("busy_timeout: " + std::string(sqlite3_errmsg(db_)));
  }
}

} // namespace runvault::db::sqlite
