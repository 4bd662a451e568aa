#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "waypoint_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  include_trace_context: true
database:
  postgres:
    connection_uri: "postgresql://localhost/checkpoints"
    pipeline: true
    worker_threads: 4
serde:
  binary: true
checkpoint:
  id_policy: CHECKPOINT_ID_POLICY_ALWAYS_NEW
tracing:
  enabled: false
  service_name: waypoint-test
)");

  auto config = waypoint::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().include_trace_context());
  assert(config.database().has_postgres());
  assert(config.database().postgres().connection_uri() == "postgresql://localhost/checkpoints");
  assert(config.database().postgres().pipeline());
  assert(config.database().postgres().worker_threads() == 4);
  assert(config.serde().binary());
  assert(config.checkpoint().id_policy() == waypoint::runtime::config::CHECKPOINT_ID_POLICY_ALWAYS_NEW);
  assert(config.tracing().service_name() == "waypoint-test");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\waypoint\\\"quoted\"\\db.sqlite"
    wal_mode: true
    busy_timeout_ms: 250
)");

  auto config = waypoint::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\waypoint\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
  assert(config.database().sqlite().busy_timeout_ms() == 250);
}

void TestQuotedNumbersStayStrings() {
  auto config = waypoint::config::ConfigLoader::ParseYaml(R"(database:
  sqlite:
    path: "12345"
logging:
  pattern: "line1\nline2☃"
)");
  assert(config.database().sqlite().path() == "12345");
  assert(config.logging().pattern() == std::string("line1\nline2☃"));
}

void TestEmptyDocumentIsDefaultConfig() {
  auto config = waypoint::config::ConfigLoader::ParseYaml("");
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());
  assert(config.checkpoint().id_policy() == waypoint::runtime::config::CHECKPOINT_ID_POLICY_PRESERVE);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(logging:
  level: info
unknown_field: 123
database:
  sqlite:
    path: "/tmp/data"
)");

  bool threw = false;
  try {
    (void)waypoint::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)waypoint::config::ConfigLoader::LoadFromYaml("/nonexistent/waypoint.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

bool RejectsYaml(const std::string& yaml) {
  try {
    (void)waypoint::config::ConfigLoader::ParseYaml(yaml);
  } catch (const waypoint::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestSettingsTheStoreCannotHonorAreRejected() {
  assert(RejectsYaml("logging:\n  level: verbose\n"));
  assert(RejectsYaml("database:\n  postgres:\n    pipeline: true\n"));
  assert(RejectsYaml("database:\n  sqlite:\n    wal_mode: true\n"));
  assert(RejectsYaml("database:\n  sqlite:\n    path: \":memory:\"\n    wal_mode: true\n"));

  assert(!RejectsYaml("logging:\n  level: warning\n"));
  assert(!RejectsYaml("database:\n  sqlite:\n    path: /tmp/checkpoints.db\n    wal_mode: true\n"));
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestEmptyDocumentIsDefaultConfig();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestSettingsTheStoreCannotHonorAreRejected();

  std::cout << "waypoint_unit_config_loader: pass\n";
  return 0;
}
