#pragma once

#include <functional>
#include <initializer_list>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/database.hpp"

namespace runvault::migration {

enum class StorageDomain { kRuns, kEventLogs, kInstigators };

// "runs", "event_logs", "instigators"; also the table-name prefix.
const char* DomainName(StorageDomain domain);
std::optional<StorageDomain> DomainFromName(const std::string& name);

using StepFn = std::function<void(db::Database&, db::Transaction&)>;

struct MigrationStep {
  std::string revision;
  std::string down_revision; // empty: first step
  std::string description;
  bool        optional = false;
  StepFn      upgrade;
  StepFn      downgrade;
};

/*
  Linear revision history of one domain.

  Validated at construction: the first step has no predecessor, every
  other step names the step before it, revisions are unique.
*/
class MigrationChain {
 public:
  explicit MigrationChain(std::vector<MigrationStep> steps);

  const std::vector<MigrationStep>& steps() const {
    return steps_;
  }

  const std::string& head() const {
    return steps_.back().revision;
  }

  // Position of `revision` in the chain; empty revision is base (-1).
  std::optional<int> IndexOf(const std::string& revision) const;

 private:
  std::vector<MigrationStep> steps_;
};

struct SchemaState {
  std::string              current_revision; // empty: uninitialized
  std::string              head_revision;
  std::set<std::string>    applied;
  std::vector<std::string> pending;
  bool                     pending_required = false;

  bool AtHead() const {
    return pending.empty();
  }

  bool IsApplied(const std::string& revision) const {
    return applied.count(revision) > 0;
  }
};

// Runs each statement, throwing on the first failure.
void ExecStatements(db::Database& db, db::Transaction& tx, std::initializer_list<std::string> statements);

} // namespace runvault::migration
