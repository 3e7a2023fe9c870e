#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace runvault::db::postgres {

namespace {

// "runv"
constexpr long long kWriterLockKey = 0x72756e76;

} // namespace

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, TxMode mode) : conn_(pool->Acquire()) {
  work_ = std::make_unique<pqxx::work>(*conn_);
  if (mode == TxMode::kRead) {
    work_->exec("SET TRANSACTION READ ONLY");
    return;
  }
  work_->exec("SELECT pg_advisory_xact_lock(" + std::to_string(kWriterLockKey) + ")");
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      work_->abort();
    } catch (const std::exception& e) {
      RUNVAULT_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  work_.reset();
}

void PgTransaction::Commit() {
  // pqxx closes the work whether or not the commit succeeds
  finished_ = true;
  work_->commit();
}

} // namespace runvault::db::postgres
