#include "internal/migration/migration_manager.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace runvault::migration {

using observability::IntField;
using observability::StringField;

void MigrationManager::RegisterDomain(StorageDomain domain, std::shared_ptr<db::Database> database,
                                      MigrationChain chain) {
  if (!database) {
    throw util::InvariantViolation(std::string("no database for domain ") + DomainName(domain));
  }
  domains_.insert_or_assign(domain, DomainEntry{std::move(database), std::move(chain)});
}

bool MigrationManager::HasDomain(StorageDomain domain) const {
  return domains_.count(domain) > 0;
}

std::vector<StorageDomain> MigrationManager::Domains() const {
  std::vector<StorageDomain> out;
  for (const auto& [domain, entry] : domains_) {
    out.push_back(domain);
  }
  return out;
}

const MigrationManager::DomainEntry& MigrationManager::Entry(StorageDomain domain) const {
  auto it = domains_.find(domain);
  if (it == domains_.end()) {
    throw util::InvariantViolation(std::string("storage domain not registered: ") + DomainName(domain));
  }
  return it->second;
}

std::string MigrationManager::RevisionTable(StorageDomain domain) {
  return std::string(DomainName(domain)) + "_schema_revision";
}

std::optional<std::string> MigrationManager::ReadRevision(StorageDomain domain, db::Database& database,
                                                          db::Transaction& tx) const {
  const auto table = RevisionTable(domain);
  if (!database.HasTable(tx, table)) {
    return std::nullopt;
  }

  std::optional<std::string> revision;
  db::ThrowIfDbError(database.Query(tx, "SELECT revision FROM " + table + ";", {},
                                    [&](const db::sql::Row& row) { revision = row.GetText(0); }),
                     "read " + table);
  return revision;
}

void MigrationManager::WriteRevision(StorageDomain domain, db::Database& database, db::Transaction& tx,
                                     const std::string& revision) const {
  const auto table = RevisionTable(domain);

  if (revision.empty()) {
    db::ThrowIfDbError(database.Exec(tx, "DROP TABLE IF EXISTS " + table + ";"), "drop " + table);
    return;
  }

  db::ThrowIfDbError(database.Exec(tx, "CREATE TABLE IF NOT EXISTS " + table + " (revision VARCHAR(255) NOT NULL);"),
                     "create " + table);
  db::ThrowIfDbError(database.Exec(tx, "DELETE FROM " + table + ";"), "clear " + table);
  db::ThrowIfDbError(database.Exec(tx, "INSERT INTO " + table + " (revision) VALUES (?);", {revision}),
                     "stamp " + table);
}

std::optional<std::string> MigrationManager::CurrentRevision(StorageDomain domain) const {
  const auto& entry = Entry(domain);
  auto        tx    = entry.database->Begin(db::TxMode::kRead);
  auto        rev   = ReadRevision(domain, *entry.database, *tx);
  tx->Commit();
  return rev;
}

const std::string& MigrationManager::HeadRevision(StorageDomain domain) const {
  return Entry(domain).chain.head();
}

SchemaState MigrationManager::State(StorageDomain domain) const {
  const auto& entry = Entry(domain);
  auto        tx    = entry.database->Begin(db::TxMode::kRead);
  auto        state = State(domain, *tx);
  tx->Commit();
  return state;
}

SchemaState MigrationManager::State(StorageDomain domain, db::Transaction& tx) const {
  const auto& entry = Entry(domain);

  SchemaState state;
  state.current_revision = ReadRevision(domain, *entry.database, tx).value_or("");
  state.head_revision    = entry.chain.head();

  auto index = entry.chain.IndexOf(state.current_revision);
  if (!index) {
    // stamped by a newer binary; nothing here is safe to write
    state.pending_required = true;
    return state;
  }

  const auto& steps = entry.chain.steps();
  for (int i = 0; i < static_cast<int>(steps.size()); ++i) {
    if (i <= *index) {
      state.applied.insert(steps[i].revision);
    } else {
      state.pending.push_back(steps[i].revision);
      state.pending_required = state.pending_required || !steps[i].optional;
    }
  }
  return state;
}

SchemaState MigrationManager::CheckWritable(StorageDomain domain) const {
  const auto& entry = Entry(domain);
  auto        tx    = entry.database->Begin(db::TxMode::kRead);
  auto        state = CheckWritable(domain, *tx);
  tx->Commit();
  return state;
}

SchemaState MigrationManager::CheckWritable(StorageDomain domain, db::Transaction& tx) const {
  auto state = State(domain, tx);
  if (state.pending_required) {
    throw util::SchemaMismatch(DomainName(domain), state.current_revision, state.head_revision);
  }
  return state;
}

std::vector<std::string> MigrationManager::Upgrade(StorageDomain domain, const std::optional<std::string>& target) {
  const auto& entry    = Entry(domain);
  const auto& steps    = entry.chain.steps();
  const auto  current  = CurrentRevision(domain).value_or("");
  const auto  from     = entry.chain.IndexOf(current);
  const auto  goal_rev = target.value_or(entry.chain.head());
  const auto  goal     = entry.chain.IndexOf(goal_rev);

  if (!from) {
    throw std::runtime_error(std::string(DomainName(domain)) + " is at revision " + current +
                             ", which this binary does not know");
  }
  if (!goal) {
    throw util::InvariantViolation("unknown target revision " + goal_rev);
  }
  if (*goal < *from) {
    throw util::InvariantViolation("target revision " + goal_rev + " is behind " + current + "; use downgrade");
  }

  std::vector<std::string> applied;
  for (int i = *from + 1; i <= *goal; ++i) {
    const auto& step = steps[i];
    RUNVAULT_LOG_INFO("applying migration", {StringField("domain", DomainName(domain)),
                                             StringField("revision", step.revision),
                                             StringField("description", step.description)});
    try {
      auto tx = entry.database->Begin();
      step.upgrade(*entry.database, *tx);
      WriteRevision(domain, *entry.database, *tx, step.revision);
      tx->Commit();
    } catch (const std::exception& e) {
      RUNVAULT_LOG_ERROR("migration failed", {StringField("domain", DomainName(domain)),
                                              StringField("revision", step.revision),
                                              StringField("error", e.what())});
      throw;
    }
    applied.push_back(step.revision);
  }

  if (!applied.empty()) {
    RUNVAULT_LOG_INFO("domain upgraded", {StringField("domain", DomainName(domain)),
                                          StringField("revision", goal_rev),
                                          IntField("steps", static_cast<int64_t>(applied.size()))});
  }
  return applied;
}

std::vector<std::string> MigrationManager::Downgrade(StorageDomain domain, const std::string& target) {
  const auto& entry   = Entry(domain);
  const auto& steps   = entry.chain.steps();
  const auto  current = CurrentRevision(domain).value_or("");
  const auto  from    = entry.chain.IndexOf(current);
  const auto  goal    = entry.chain.IndexOf(target);

  if (!from) {
    throw std::runtime_error(std::string(DomainName(domain)) + " is at revision " + current +
                             ", which this binary does not know");
  }
  if (!goal) {
    throw util::InvariantViolation("unknown target revision " + target);
  }
  if (*goal > *from) {
    throw util::InvariantViolation("target revision " + target + " is ahead of " + current + "; use upgrade");
  }

  std::vector<std::string> reverted;
  for (int i = *from; i > *goal; --i) {
    const auto& step = steps[i];
    RUNVAULT_LOG_INFO("reverting migration", {StringField("domain", DomainName(domain)),
                                              StringField("revision", step.revision)});
    auto tx = entry.database->Begin();
    step.downgrade(*entry.database, *tx);
    WriteRevision(domain, *entry.database, *tx, step.down_revision);
    tx->Commit();
    reverted.push_back(step.revision);
  }
  return reverted;
}

std::map<StorageDomain, std::vector<std::string>> MigrationManager::UpgradeAll() {
  std::map<StorageDomain, std::vector<std::string>> out;
  for (const auto& [domain, entry] : domains_) {
    out[domain] = Upgrade(domain);
  }
  return out;
}

bool MigrationManager::EnsureInitialized(StorageDomain domain) {
  if (CurrentRevision(domain)) {
    return false;
  }
  RUNVAULT_LOG_INFO("initializing storage", {StringField("domain", DomainName(domain))});
  Upgrade(domain);
  return true;
}

} // namespace runvault::migration
