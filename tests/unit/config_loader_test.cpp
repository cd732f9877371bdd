#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using sportsledger::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "sportsledger_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(database:
  sqlite:
    path: "/var/lib/ledger/ledger.db"
    wal_mode: true
logging:
  level: debug
analysis:
  edge_threshold: 0.05
  analysis_version: "2.1.0"
  code_version: abc123
  model_version: "no-vig-v1"
  stake_units: 10
scoring:
  log_loss_epsilon: 0.000001
batch:
  workers: 4
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "/var/lib/ledger/ledger.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");
  assert(config.analysis().edge_threshold() == 0.05);
  assert(config.analysis().analysis_version() == "2.1.0");
  assert(config.analysis().code_version() == "abc123");
  assert(config.analysis().stake_units() == 10.0);
  assert(config.scoring().log_loss_epsilon() == 0.000001);
  assert(config.batch().workers() == 4);
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(analysis:
  code_version: "1234"
  schema_version: "2"
)");
  assert(config.analysis().code_version() == "1234");
  assert(config.analysis().schema_version() == "2");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "C:\\ledger\\\"quoted\"\\db.sqlite"
)");
  assert(config.database().sqlite().path() == "C:\\ledger\\\"quoted\"\\db.sqlite");
}

void TestDefaultsFillEmptyFields() {
  auto config = ConfigLoader::WithDefaults(ConfigLoader::LoadFromYamlString(""));
  assert(config.database().has_memory());
  assert(config.logging().level() == "info");
  assert(config.analysis().edge_threshold() == 0.03);
  assert(config.analysis().analysis_version() == "1.0.0");
  assert(config.analysis().code_version() == "unknown");
  assert(config.analysis().schema_version() == "1.0.0");
  assert(config.analysis().stake_units() == 1.0);
  assert(config.scoring().log_loss_epsilon() == 1e-9);
  assert(config.batch().workers() == 1);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestInvalidValuesAreRejected() {
  const auto rejects = [](const std::string& yaml) {
    try {
      (void)ConfigLoader::WithDefaults(ConfigLoader::LoadFromYamlString(yaml));
    } catch (const std::runtime_error&) {
      return true;
    }
    return false;
  };

  assert(rejects("database:\n  sqlite:\n    wal_mode: true\n"));
  assert(rejects("analysis:\n  edge_threshold: -0.1\n"));
  assert(rejects("scoring:\n  log_loss_epsilon: 0.5\n"));
  assert(rejects("- just\n- a list\n"));
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestQuotedNumbersStayStrings();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestDefaultsFillEmptyFields();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();

  std::cout << "sportsledger_unit_config_loader: pass\n";
  return 0;
}
