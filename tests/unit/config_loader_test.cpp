#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using roster::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "roster_ledger_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestEmptyDocumentGetsDefaults() {
  const auto config = ConfigLoader::LoadFromString("");

  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_memory());
  assert(config.league_defaults().max_roster_size() == 22);
  assert(config.league_defaults().cooldown_hours() == 48);
  assert(config.league_defaults().priority_policy() == roster::runtime::config::PRIORITY_POLICY_ROTATING);
  assert(config.league_defaults().processing_time_utc() == "08:00");
  assert(!config.claim_processing().scheduler_enabled());
  assert(config.claim_processing().poll_interval_sec() == 60);
  assert(config.claim_processing().batch_size() == 100);
  assert(config.claim_processing().processing_window_sec() == 300);
}

void TestFullFileFromDisk() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
database:
  sqlite:
    path: "/var/lib/roster/ledger.db"
league_defaults:
  max_roster_size: 18
  cooldown_hours: 24
  priority_policy: PRIORITY_POLICY_REVERSE_STANDINGS
  processing_time_utc: "09:30"
claim_processing:
  scheduler_enabled: true
  poll_interval_sec: 15
  batch_size: 250
logging:
  level: debug
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().sqlite().path() == "/var/lib/roster/ledger.db");
  assert(config.database().sqlite().busy_timeout_ms() == 5000);
  assert(config.database().sqlite().league_lock_stale_sec() == 600);
  assert(config.league_defaults().max_roster_size() == 18);
  assert(config.league_defaults().cooldown_hours() == 24);
  assert(config.league_defaults().priority_policy() == roster::runtime::config::PRIORITY_POLICY_REVERSE_STANDINGS);
  assert(config.league_defaults().processing_time_utc() == "09:30");
  assert(config.claim_processing().scheduler_enabled());
  assert(config.claim_processing().poll_interval_sec() == 15);
  assert(config.claim_processing().batch_size() == 250);
  assert(config.logging().level() == "debug");
}

void TestShippedExampleLoads() {
  const auto config = ConfigLoader::LoadFromYaml(ROSTER_EXAMPLE_CONFIG);
  assert(config.database().has_sqlite());
  assert(config.claim_processing().scheduler_enabled());
  assert(config.observability().transport() == roster::runtime::config::OTLP_TRANSPORT_GRPC);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\roster\\\"quoted\"\\ledger.db"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\roster\\\"quoted\"\\ledger.db");
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromString(R"(database:
  postgres:
    connection_uri: "5432"
)");
  assert(config.database().postgres().connection_uri() == "5432");
  assert(config.database().postgres().max_connections() == 16);
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects(R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)"));
  assert(Rejects(R"(league_defaults:
  roster_cap: 10
)"));
}

void TestInvalidValuesAreRejected() {
  assert(Rejects("database:\n  sqlite:\n    busy_timeout_ms: 10\n"));
  assert(Rejects("database:\n  postgres:\n    max_connections: 4\n"));
  assert(Rejects("league_defaults:\n  processing_time_utc: \"25:00\"\n"));
  assert(Rejects("league_defaults:\n  processing_time_utc: \"noon\"\n"));
  assert(Rejects("claim_processing:\n  batch_size: 5000\n"));
  assert(Rejects("server: [unterminated\n"));

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/roster-ledger.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must report unreadable files.");
}

} // namespace

int main() {
  TestEmptyDocumentGetsDefaults();
  TestFullFileFromDisk();
  TestShippedExampleLoads();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();

  std::cout << "roster_ledger_unit_config_loader: pass\n";
  return 0;
}
