#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/database.hpp"
#include "internal/migration/migration_step.hpp"

namespace runvault::migration {

/*
  MigrationManager

  Tracks the applied revision of each storage domain in a single-row
  `<domain>_schema_revision` table and moves it along the domain's
  chain.

  - Upgrade applies one step per transaction, together with the
    revision row; a failing step leaves the previous revision in place.
  - Downgrade walks the chain backwards; operator/test use only.
  - CheckWritable is the write-path guard: it throws SchemaMismatch when
    a required step is pending and otherwise returns the schema state,
    which tells a store whether optional steps have been applied.

  Domains are registered once at startup; quiescing writers while
  migrating is the caller's job.
*/
class MigrationManager {
 public:
  void RegisterDomain(StorageDomain domain, std::shared_ptr<db::Database> database, MigrationChain chain);

  bool HasDomain(StorageDomain domain) const;
  std::vector<StorageDomain> Domains() const;

  std::optional<std::string> CurrentRevision(StorageDomain domain) const;
  const std::string&         HeadRevision(StorageDomain domain) const;

  SchemaState State(StorageDomain domain) const;
  SchemaState State(StorageDomain domain, db::Transaction& tx) const;

  SchemaState CheckWritable(StorageDomain domain) const;
  SchemaState CheckWritable(StorageDomain domain, db::Transaction& tx) const;

  // Returns the revisions applied, in order. No-op at head.
  std::vector<std::string> Upgrade(StorageDomain domain, const std::optional<std::string>& target = std::nullopt);

  // `target` empty means base: every step reverted, revision table dropped.
  std::vector<std::string> Downgrade(StorageDomain domain, const std::string& target);

  std::map<StorageDomain, std::vector<std::string>> UpgradeAll();

  // Brings a domain with no revision row to head and returns true;
  // leaves a stamped domain untouched.
  bool EnsureInitialized(StorageDomain domain);

 private:
  struct DomainEntry {
    std::shared_ptr<db::Database> database;
    MigrationChain                chain;
  };

  const DomainEntry& Entry(StorageDomain domain) const;

  static std::string RevisionTable(StorageDomain domain);
  std::optional<std::string> ReadRevision(StorageDomain domain, db::Database& database, db::Transaction& tx) const;
  void WriteRevision(StorageDomain domain, db::Database& database, db::Transaction& tx, const std::string& revision) const;

  std::map<StorageDomain, DomainEntry> domains_;
};

} // namespace runvault::migration
