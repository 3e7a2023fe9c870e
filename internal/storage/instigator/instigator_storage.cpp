#include "internal/storage/instigator/instigator_storage.hpp"

#include "internal/migration/schema/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/serdes/serdes.hpp"
#include "internal/storage/common/sql_where.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace runvault::storage {

using migration::StorageDomain;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

InstigatorStorage::InstigatorStorage(std::shared_ptr<db::Database> database,
                                     std::shared_ptr<migration::MigrationManager> migrations,
                                     const serdes::Registry& registry)
    : database_(std::move(database)), migrations_(std::move(migrations)), registry_(registry) {
  if (!migrations_->HasDomain(StorageDomain::kInstigators)) {
    migrations_->RegisterDomain(StorageDomain::kInstigators, database_, migration::schema::InstigatorsChain());
  }
  migrations_->EnsureInitialized(StorageDomain::kInstigators);
}

std::string InstigatorStorage::OriginId(const model::ExternalInstigatorOrigin& origin) const {
  return serdes::CreateSnapshotId(origin, registry_);
}

std::string InstigatorStorage::RepositoryOriginId(const model::ExternalRepositoryOrigin& origin) const {
  return serdes::CreateSnapshotId(origin, registry_);
}

// ------------------------------------------------------------------
// State
// ------------------------------------------------------------------

std::vector<model::InstigatorState> InstigatorStorage::AllInstigatorState(
    const std::optional<std::string>& repository_origin_id, std::optional<model::InstigatorType> instigator_type) {
  SqlWhere where;
  if (repository_origin_id) where.Add("repository_origin_id = ?", {*repository_origin_id});
  if (instigator_type) where.Add("job_type = ?", {std::string(model::InstigatorTypeName(*instigator_type))});

  auto tx = database_->Begin(db::TxMode::kRead);

  std::vector<model::InstigatorState> out;
  db::ThrowIfDbError(database_->Query(*tx, "SELECT job_body FROM jobs" + where.Render() + " ORDER BY id ASC;",
                                      where.params(),
                                      [&](const db::sql::Row& row) {
                                        out.push_back(
                                            serdes::Deserialize<model::InstigatorState>(row.GetText(0), registry_));
                                      }),
                     "query instigator state");
  tx->Commit();
  return out;
}

std::optional<model::InstigatorState> InstigatorStorage::GetInstigatorState(const std::string& origin_id) {
  auto tx = database_->Begin(db::TxMode::kRead);

  std::optional<model::InstigatorState> state;
  db::ThrowIfDbError(database_->Query(*tx, "SELECT job_body FROM jobs WHERE job_origin_id = ?;", {origin_id},
                                      [&](const db::sql::Row& row) {
                                        state = serdes::Deserialize<model::InstigatorState>(row.GetText(0), registry_);
                                      }),
                     "read instigator state");
  tx->Commit();
  return state;
}

model::InstigatorState InstigatorStorage::AddInstigatorState(const model::InstigatorState& state) {
  const auto origin_id = OriginId(state.origin);

  auto tx = database_->Begin();
  migrations_->CheckWritable(StorageDomain::kInstigators, *tx);

  const double now = util::NowSeconds();
  db::ThrowIfDbError(database_->Exec(*tx,
                                     "INSERT INTO jobs (job_origin_id, repository_origin_id, status, job_type,"
                                     " job_body, create_timestamp, update_timestamp) VALUES (?, ?, ?, ?, ?, ?, ?);",
                                     {origin_id, RepositoryOriginId(state.origin.external_repository_origin),
                                      std::string(model::InstigatorStatusName(state.status)),
                                      std::string(model::InstigatorTypeName(state.instigator_type)),
                                      serdes::Serialize(state, registry_), now, now}),
                     "insert instigator state " + state.name());
  tx->Commit();
  return state;
}

model::InstigatorState InstigatorStorage::UpdateInstigatorState(const model::InstigatorState& state) {
  const auto origin_id = OriginId(state.origin);

  auto tx = database_->Begin();
  migrations_->CheckWritable(StorageDomain::kInstigators, *tx);

  bool exists = false;
  db::ThrowIfDbError(database_->Query(*tx, "SELECT 1 FROM jobs WHERE job_origin_id = ?;", {origin_id},
                                      [&](const db::sql::Row&) { exists = true; }),
                     "check instigator state");
  if (!exists) {
    throw util::NotFound("instigator " + state.name() + " (" + origin_id + ") has no stored state");
  }

  db::ThrowIfDbError(database_->Exec(*tx,
                                     "UPDATE jobs SET status = ?, job_type = ?, job_body = ?, update_timestamp = ?"
                                     " WHERE job_origin_id = ?;",
                                     {std::string(model::InstigatorStatusName(state.status)),
                                      std::string(model::InstigatorTypeName(state.instigator_type)),
                                      serdes::Serialize(state, registry_), util::NowSeconds(), origin_id}),
                     "update instigator state " + state.name());
  tx->Commit();
  return state;
}

void InstigatorStorage::DeleteInstigatorState(const std::string& origin_id) {
  auto tx = database_->Begin();
  migrations_->CheckWritable(StorageDomain::kInstigators, *tx);

  bool exists = false;
  db::ThrowIfDbError(database_->Query(*tx, "SELECT 1 FROM jobs WHERE job_origin_id = ?;", {origin_id},
                                      [&](const db::sql::Row&) { exists = true; }),
                     "check instigator state");
  if (!exists) {
    throw util::NotFound("no instigator state for origin " + origin_id);
  }

  db::ThrowIfDbError(database_->Exec(*tx, "DELETE FROM jobs WHERE job_origin_id = ?;", {origin_id}),
                     "delete instigator state");
  tx->Commit();
}

// ------------------------------------------------------------------
// Ticks
// ------------------------------------------------------------------

model::InstigatorTick InstigatorStorage::CreateTick(const model::TickData& data) {
  auto tx = database_->Begin();
  migrations_->CheckWritable(StorageDomain::kInstigators, *tx);

  model::InstigatorTick tick;
  tick.data = data;
  if (model::IsTerminal(data.status) && !tick.data.end_timestamp) {
    tick.data.end_timestamp = data.timestamp;
  }

  const double now = util::NowSeconds();
  db::ThrowIfDbError(database_->Insert(*tx,
                                       "INSERT INTO job_ticks (job_origin_id, status, type, timestamp, tick_body,"
                                       " create_timestamp, update_timestamp) VALUES (?, ?, ?, ?, ?, ?, ?)",
                                       {tick.data.instigator_origin_id,
                                        std::string(model::TickStatusName(tick.data.status)),
                                        std::string(model::InstigatorTypeName(tick.data.instigator_type)),
                                        tick.data.timestamp, serdes::Serialize(tick.data, registry_), now, now},
                                       &tick.tick_id),
                     "insert tick for " + tick.data.instigator_name);
  tx->Commit();
  return tick;
}

model::InstigatorTick InstigatorStorage::UpdateTick(const model::InstigatorTick& tick) {
  auto tx = database_->Begin();
  migrations_->CheckWritable(StorageDomain::kInstigators, *tx);

  std::optional<std::string> body;
  db::ThrowIfDbError(database_->Query(*tx, "SELECT tick_body FROM job_ticks WHERE id = ?;", {tick.tick_id},
                                      [&](const db::sql::Row& row) { body = row.GetText(0); }),
                     "read tick");
  if (!body) {
    throw util::NotFound("tick " + std::to_string(tick.tick_id) + " not found");
  }

  const auto persisted = serdes::Deserialize<model::TickData>(*body, registry_);

  model::InstigatorTick next = tick;
  if (!model::IsTerminal(persisted.status) && model::IsTerminal(next.data.status) && !next.data.end_timestamp) {
    next.data.end_timestamp = util::NowSeconds();
  }
  model::ValidateTickTransition(persisted, next.data);

  db::ThrowIfDbError(database_->Exec(*tx,
                                     "UPDATE job_ticks SET status = ?, type = ?, timestamp = ?, tick_body = ?,"
                                     " update_timestamp = ? WHERE id = ?;",
                                     {std::string(model::TickStatusName(next.data.status)),
                                      std::string(model::InstigatorTypeName(next.data.instigator_type)),
                                      next.data.timestamp, serdes::Serialize(next.data, registry_), util::NowSeconds(),
                                      next.tick_id}),
                     "update tick");
  tx->Commit();
  return next;
}

std::vector<model::InstigatorTick> InstigatorStorage::QueryTicks(db::Transaction& tx, const std::string& sql,
                                                                 const db::sql::Params& params) {
  std::vector<model::InstigatorTick> out;
  db::ThrowIfDbError(database_->Query(tx, sql, params,
                                      [&](const db::sql::Row& row) {
                                        model::InstigatorTick tick;
                                        tick.tick_id = row.GetInt64(0);
                                        tick.data    = serdes::Deserialize<model::TickData>(row.GetText(1), registry_);
                                        out.push_back(std::move(tick));
                                      }),
                     "query ticks");
  return out;
}

std::vector<model::InstigatorTick> InstigatorStorage::GetTicks(const std::string& origin_id,
                                                               const model::TicksFilter& filter,
                                                               std::optional<int> limit) {
  SqlWhere where;
  where.Add("job_origin_id = ?", {origin_id});
  if (filter.before) where.Add("timestamp < ?", {*filter.before});
  if (filter.after) where.Add("timestamp > ?", {*filter.after});
  if (filter.before_tick_id) where.Add("id < ?", {*filter.before_tick_id});
  if (!filter.statuses.empty()) {
    std::vector<std::string> names;
    for (auto status : filter.statuses) names.emplace_back(model::TickStatusName(status));
    where.AddIn("status", names);
  }

  std::string sql    = "SELECT id, tick_body FROM job_ticks" + where.Render() + " ORDER BY id DESC";
  auto        params = where.params();
  if (limit) {
    sql += " LIMIT ?";
    params.emplace_back(static_cast<int64_t>(*limit));
  }

  auto tx  = database_->Begin(db::TxMode::kRead);
  auto out = QueryTicks(*tx, sql + ";", params);
  tx->Commit();
  return out;
}

int64_t InstigatorStorage::PurgeTicks(const std::string& origin_id, model::TickStatus status, double before) {
  auto tx = database_->Begin();
  migrations_->CheckWritable(StorageDomain::kInstigators, *tx);

  const db::sql::Params params = {origin_id, std::string(model::TickStatusName(status)), before};

  int64_t count = 0;
  db::ThrowIfDbError(database_->Query(*tx,
                                      "SELECT COUNT(*) FROM job_ticks WHERE job_origin_id = ? AND status = ?"
                                      " AND timestamp < ?;",
                                      params, [&](const db::sql::Row& row) { count = row.GetInt64(0); }),
                     "count ticks");
  db::ThrowIfDbError(database_->Exec(*tx,
                                     "DELETE FROM job_ticks WHERE job_origin_id = ? AND status = ? AND timestamp < ?;",
                                     params),
                     "purge ticks");
  tx->Commit();

  RUNVAULT_LOG_INFO("purged ticks", {StringField("origin_id", origin_id),
                                     StringField("status", model::TickStatusName(status)), DoubleField("before", before),
                                     IntField("count", count)});
  return count;
}

} // namespace runvault::storage
