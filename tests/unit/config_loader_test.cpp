#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "runvault_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  pattern: "[%l] %v"
storage:
  run_storage:
    sqlite:
      path: /var/lib/runvault/runs.db
  event_log_storage:
    postgres:
      connection_uri: "postgresql://runvault@db/events"
      max_connections: 8
  instigator_storage:
    sqlite:
      path: ":memory:"
backfill:
  batch_size: 250
)");

  auto config = runvault::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.storage().run_storage().has_sqlite());
  assert(config.storage().run_storage().sqlite().path() == "/var/lib/runvault/runs.db");
  assert(config.storage().event_log_storage().has_postgres());
  assert(config.storage().event_log_storage().postgres().connection_uri() == "postgresql://runvault@db/events");
  assert(config.storage().event_log_storage().postgres().max_connections() == 8);
  assert(config.storage().instigator_storage().sqlite().path() == ":memory:");
  assert(config.backfill().batch_size() == 250);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(storage:
  run_storage:
    sqlite:
      path: "C:\\runvault\\\"quoted\"\\runs.sqlite"
)");

  auto config = runvault::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.storage().run_storage().sqlite().path() == "C:\\runvault\\\"quoted\"\\runs.sqlite");
}

void TestQuotedNumbersStayStrings() {
  auto config = runvault::config::ConfigLoader::LoadFromYamlString(R"(storage:
  run_storage:
    sqlite:
      path: "5000"
)");
  assert(config.storage().run_storage().sqlite().path() == "5000");
}

void TestEmptyDocumentIsDefaultConfig() {
  auto config = runvault::config::ConfigLoader::LoadFromYamlString("");
  assert(!config.has_storage());
  assert(config.backfill().batch_size() == 0);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(storage:
  run_storage:
    sqlite:
      path: "/tmp/runs.db"
      wal_mode: true
)");

  bool threw = false;
  try {
    (void)runvault::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestPostgresDomainNeedsConnectionUri() {
  bool threw = false;
  try {
    (void)runvault::config::ConfigLoader::LoadFromYamlString(R"(storage:
  event_log_storage:
    postgres:
      max_connections: 4
)");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("event_log_storage") != std::string::npos;
  }
  assert(threw);
}

void TestUnknownLogLevelIsRejected() {
  bool threw = false;
  try {
    (void)runvault::config::ConfigLoader::LoadFromYamlString("logging:\n  level: chatty\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  auto quiet = runvault::config::ConfigLoader::LoadFromYamlString("logging:\n  level: \"off\"\n");
  assert(quiet.logging().level() == "off");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)runvault::config::ConfigLoader::LoadFromYaml("/nonexistent/runvault.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigLoads();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestEmptyDocumentIsDefaultConfig();
  TestUnknownFieldsAreRejected();
  TestPostgresDomainNeedsConnectionUri();
  TestUnknownLogLevelIsRejected();
  TestMissingFileIsReported();

  std::cout << "runvault_unit_config_loader: pass\n";
  return 0;
}
