#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/backfill/backfill_coordinator.hpp"
#include "internal/bundle/run_bundle.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/migration/migration_step.hpp"
#include "internal/migration/schema/schema.hpp"
#include "internal/model/registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using runvault::factory::Instance;
using runvault::migration::StorageDomain;

static void Usage() {
  std::cout << "Usage:\n"
            << "  runvaultctl --config <config.yaml> migrate\n"
            << "  runvaultctl --config <config.yaml> downgrade <runs|event_logs|instigators> <revision|base>\n"
            << "  runvaultctl --config <config.yaml> revision\n"
            << "  runvaultctl --config <config.yaml> reindex [--force]\n"
            << "  runvaultctl --config <config.yaml> export <run_id> <file>\n"
            << "  runvaultctl --config <config.yaml> import <file>\n";
}

static void PrintSummary(const runvault::backfill::MigrationSummary& summary) {
  std::cout << summary.name << ": ";
  if (summary.skipped) {
    std::cout << "already built\n";
    return;
  }
  std::cout << summary.migrated << " migrated, " << summary.malformed << " malformed, " << summary.batches
            << " batches\n";
}

static int Migrate(Instance& instance) {
  for (const auto& [domain, applied] : instance.migrations->UpgradeAll()) {
    std::cout << runvault::migration::DomainName(domain) << ": ";
    if (applied.empty()) {
      std::cout << "up to date\n";
      continue;
    }
    for (size_t i = 0; i < applied.size(); ++i) {
      std::cout << (i ? ", " : "") << applied[i];
    }
    std::cout << "\n";
  }
  return 0;
}

static int Downgrade(Instance& instance, const std::string& domain_name, const std::string& revision) {
  auto domain = runvault::migration::DomainFromName(domain_name);
  if (!domain) {
    std::cerr << "unknown storage domain: " << domain_name << "\n";
    return 1;
  }
  const std::string target = revision == "base" ? "" : revision;
  for (const auto& reverted : instance.migrations->Downgrade(*domain, target)) {
    std::cout << "reverted " << reverted << "\n";
  }
  return 0;
}

static int Revision(Instance& instance) {
  for (auto domain : instance.migrations->Domains()) {
    auto state = instance.migrations->State(domain);
    std::cout << runvault::migration::DomainName(domain) << ": "
              << (state.current_revision.empty() ? "<none>" : state.current_revision) << " (head "
              << state.head_revision << ")";
    if (!state.pending.empty()) {
      std::cout << " pending:";
      for (const auto& revision : state.pending) std::cout << " " << revision;
      if (!state.pending_required) std::cout << " (optional)";
    }
    std::cout << "\n";
  }
  return 0;
}

static int Reindex(Instance& instance, bool force) {
  PrintSummary(instance.run_storage->Migrate(force, instance.backfill_batch_size));
  const auto runs = instance.migrations->State(runvault::migration::StorageDomain::kRuns);
  if (runs.IsApplied(runvault::migration::schema::kRunsRunStats)) {
    PrintSummary(instance.run_storage->MigrateRunStats(*instance.event_log_storage, force,
                                                       instance.backfill_batch_size));
  } else {
    std::cout << runvault::storage::RunStorage::kRunStartEndIndex << ": needs "
              << runvault::migration::schema::kRunsRunStats << "\n";
  }
  auto events = instance.event_log_storage->Reindex(force, instance.backfill_batch_size);
  for (const auto& summary : events.migrations) {
    PrintSummary(summary);
  }
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string              config_path = argv[2];
  const std::string              cmd         = argv[3];
  const std::vector<std::string> args(argv + 4, argv + argc);

  try {
    auto config = runvault::config::ConfigLoader::LoadFromYaml(config_path);
    runvault::observability::InitializeLogging(config);

    auto instance = runvault::factory::BuildInstance(config);

    int rc = 1;
    if (cmd == "migrate" && args.empty()) {
      rc = Migrate(instance);
    } else if (cmd == "downgrade" && args.size() == 2) {
      rc = Downgrade(instance, args[0], args[1]);
    } else if (cmd == "revision" && args.empty()) {
      rc = Revision(instance);
    } else if (cmd == "reindex" && (args.empty() || (args.size() == 1 && args[0] == "--force"))) {
      rc = Reindex(instance, !args.empty());
    } else if (cmd == "export" && args.size() == 2) {
      runvault::bundle::RunBundler bundler(*instance.run_storage, *instance.event_log_storage,
                                           runvault::model::DefaultRegistry());
      bundler.Export(args[0], args[1]);
      rc = 0;
    } else if (cmd == "import" && args.size() == 1) {
      runvault::bundle::RunBundler bundler(*instance.run_storage, *instance.event_log_storage,
                                           runvault::model::DefaultRegistry());
      auto run = bundler.Import(args[0]);
      std::cout << "imported " << run.run_id << "\n";
      rc = 0;
    } else {
      Usage();
    }

    runvault::observability::ShutdownLogging();
    return rc;
  } catch (const runvault::util::SchemaMismatch& e) {
    std::cerr << e.what() << "\n";
    runvault::observability::ShutdownLogging();
    return 2;
  } catch (const std::exception& e) {
    RUNVAULT_LOG_ERROR("runvaultctl failed", {runvault::observability::StringField("command", cmd),
                                              runvault::observability::StringField("error", e.what())});
    runvault::observability::ShutdownLogging();
    return 2;
  }
}
