#include "internal/db/sql/dialect.hpp"
#include "internal/migration/schema/schema.hpp"

namespace runvault::migration::schema {

using db::sql::AutoIncrementPrimaryKey;
using db::sql::JsonNumberField;

namespace {

void CreateLegacyScheduleTables(db::Database& db, db::Transaction& tx) {
  const auto pk = AutoIncrementPrimaryKey(db.dialect());
  ExecStatements(db, tx,
                 {
                     "CREATE TABLE schedules ("
                     " id " + pk + ","
                     " schedule_origin_id VARCHAR(255) UNIQUE,"
                     " repository_origin_id VARCHAR(255),"
                     " status VARCHAR(63),"
                     " schedule_body TEXT,"
                     " create_timestamp DOUBLE PRECISION,"
                     " update_timestamp DOUBLE PRECISION)",
                     "CREATE TABLE schedule_ticks ("
                     " id " + pk + ","
                     " schedule_origin_id VARCHAR(255),"
                     " status VARCHAR(63),"
                     " tick_body TEXT,"
                     " create_timestamp DOUBLE PRECISION,"
                     " update_timestamp DOUBLE PRECISION)",
                     "CREATE INDEX idx_schedule_ticks_origin ON schedule_ticks(schedule_origin_id)",
                 });
}

// Copies keep their ids; the sequence must move past them.
void ResetSequence(db::Database& db, db::Transaction& tx, const std::string& table) {
  if (db.dialect() != db::Dialect::kPostgres) return;
  ExecStatements(db, tx,
                 {"SELECT setval(pg_get_serial_sequence('" + table + "', 'id'), "
                  "COALESCE((SELECT MAX(id) FROM " + table + "), 0) + 1, false)"});
}

} // namespace

MigrationChain InstigatorsChain() {
  std::vector<MigrationStep> steps;

  steps.push_back(MigrationStep{
      .revision      = kInstigatorsInitial,
      .down_revision = "",
      .description   = "schedules and schedule_ticks",
      .optional      = false,
      .upgrade       = CreateLegacyScheduleTables,
      .downgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx, {"DROP TABLE schedule_ticks", "DROP TABLE schedules"});
          },
  });

  steps.push_back(MigrationStep{
      .revision      = kInstigatorsUnify,
      .down_revision = kInstigatorsInitial,
      .description   = "merge schedules into jobs / job_ticks with a type column",
      .optional      = false,
      .upgrade =
          [](db::Database& db, db::Transaction& tx) {
            const auto pk = AutoIncrementPrimaryKey(db.dialect());
            // tick time lives in the body; create_timestamp is when the row was written
            const auto tick_time =
                "COALESCE(" + JsonNumberField(db.dialect(), "tick_body", "timestamp") + ", create_timestamp)";
            ExecStatements(db, tx,
                           {
                               "CREATE TABLE jobs ("
                               " id " + pk + ","
                               " job_origin_id VARCHAR(255) NOT NULL UNIQUE,"
                               " repository_origin_id VARCHAR(255),"
                               " status VARCHAR(63),"
                               " job_type VARCHAR(63),"
                               " job_body TEXT NOT NULL,"
                               " create_timestamp DOUBLE PRECISION,"
                               " update_timestamp DOUBLE PRECISION)",
                               "CREATE TABLE job_ticks ("
                               " id " + pk + ","
                               " job_origin_id VARCHAR(255) NOT NULL,"
                               " status VARCHAR(63),"
                               " type VARCHAR(63),"
                               " timestamp DOUBLE PRECISION,"
                               " tick_body TEXT NOT NULL,"
                               " create_timestamp DOUBLE PRECISION,"
                               " update_timestamp DOUBLE PRECISION)",
                               "INSERT INTO jobs (id, job_origin_id, repository_origin_id, status, job_type, job_body,"
                               " create_timestamp, update_timestamp)"
                               " SELECT id, schedule_origin_id, repository_origin_id, status, 'SCHEDULE', schedule_body,"
                               " create_timestamp, update_timestamp FROM schedules",
                               "INSERT INTO job_ticks (id, job_origin_id, status, type, timestamp, tick_body,"
                               " create_timestamp, update_timestamp)"
                               " SELECT id, schedule_origin_id, status, 'SCHEDULE', " + tick_time + ", tick_body,"
                               " create_timestamp, update_timestamp FROM schedule_ticks",
                           });
            ResetSequence(db, tx, "jobs");
            ResetSequence(db, tx, "job_ticks");
            ExecStatements(db, tx, {"DROP TABLE schedule_ticks", "DROP TABLE schedules"});
          },
      // one-way: only the legacy table shape comes back
      .downgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx, {"DROP TABLE job_ticks", "DROP TABLE jobs"});
            CreateLegacyScheduleTables(db, tx);
          },
  });

  steps.push_back(MigrationStep{
      .revision      = kInstigatorsTickIndexes,
      .down_revision = kInstigatorsUnify,
      .description   = "job_ticks lookup indexes",
      .optional      = false,
      .upgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx,
                           {
                               "CREATE INDEX idx_job_tick_status ON job_ticks(job_origin_id, status)",
                               "CREATE INDEX idx_job_tick_timestamp ON job_ticks(job_origin_id, timestamp)",
                               "CREATE INDEX idx_jobs_repository ON jobs(repository_origin_id)",
                           });
          },
      .downgrade =
          [](db::Database& db, db::Transaction& tx) {
            ExecStatements(db, tx,
                           {"DROP INDEX idx_jobs_repository", "DROP INDEX idx_job_tick_timestamp",
                            "DROP INDEX idx_job_tick_status"});
          },
  });

  return MigrationChain(std::move(steps));
}

} // namespace runvault::migration::schema
