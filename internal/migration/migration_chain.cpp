#include "internal/migration/migration_step.hpp"

#include "internal/util/errors.hpp"

namespace runvault::migration {

const char* DomainName(StorageDomain domain) {
  switch (domain) {
    case StorageDomain::kRuns:
      return "runs";
    case StorageDomain::kEventLogs:
      return "event_logs";
    case StorageDomain::kInstigators:
      return "instigators";
  }
  return "unknown";
}

std::optional<StorageDomain> DomainFromName(const std::string& name) {
  for (auto domain : {StorageDomain::kRuns, StorageDomain::kEventLogs, StorageDomain::kInstigators}) {
    if (name == DomainName(domain)) return domain;
  }
  return std::nullopt;
}

MigrationChain::MigrationChain(std::vector<MigrationStep> steps) : steps_(std::move(steps)) {
  if (steps_.empty()) {
    throw util::InvariantViolation("migration chain has no steps");
  }

  std::set<std::string> seen;
  std::string           previous;
  for (const auto& step : steps_) {
    if (step.revision.empty()) {
      throw util::InvariantViolation("migration step without a revision id");
    }
    if (!seen.insert(step.revision).second) {
      throw util::InvariantViolation("duplicate revision " + step.revision);
    }
    if (step.down_revision != previous) {
      throw util::InvariantViolation("revision " + step.revision + " follows '" + step.down_revision +
                                     "', expected '" + previous + "'");
    }
    if (!step.upgrade || !step.downgrade) {
      throw util::InvariantViolation("revision " + step.revision + " is missing up or down logic");
    }
    previous = step.revision;
  }
}

std::optional<int> MigrationChain::IndexOf(const std::string& revision) const {
  if (revision.empty()) return -1;
  for (size_t i = 0; i < steps_.size(); ++i) {
    if (steps_[i].revision == revision) return static_cast<int>(i);
  }
  return std::nullopt;
}

void ExecStatements(db::Database& db, db::Transaction& tx, std::initializer_list<std::string> statements) {
  for (const auto& statement : statements) {
    db::ThrowIfDbError(db.Exec(tx, statement), statement);
  }
}

} // namespace runvault::migration
