#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/catalog/role_catalog.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace {

using roster::config::ConfigLoader;
using roster::runtime::config::REASSIGN_POLICY_REPLACE;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "roster_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "C:\\roster\\\"quoted\"\\db.sqlite"
    busy_timeout_ms: 250
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "C:\\roster\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().busy_timeout_ms() == 250);
}

void TestScalarEscapingForNewlineAndUnicode() {
  auto config = ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "line1\nline2☃"
)");
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(catalog:
  roles:
    - code: "42"
      display_name: "true"
      sort_order: 7
)");
  assert(config.catalog().roles_size() == 1);
  assert(config.catalog().roles(0).code() == "42");
  assert(config.catalog().roles(0).display_name() == "true");
  assert(config.catalog().roles(0).sort_order() == 7);
}

void TestCatalogAndEngineSections() {
  auto config = ConfigLoader::LoadFromYamlString(R"(engine:
  reassign_policy: REASSIGN_POLICY_REPLACE
  lock_timeout_ms: 1500
catalog:
  roles:
    - { code: "timekeeper", display_name: "Timekeeper", unique: true, sort_order: 10 }
    - { code: "backup_timer", display_name: "Backup Timer", sort_order: 20 }
  exclusion_groups:
    - name: "timing"
      roles: ["timekeeper", "backup_timer"]
locations:
  - name: "Angarka"
  - name: "Old Park"
    active: false
schedule:
  event_weekday: "sunday"
)");

  assert(config.engine().reassign_policy() == REASSIGN_POLICY_REPLACE);
  assert(config.engine().lock_timeout_ms() == 1500);
  assert(config.engine().max_commit_attempts() == 0);

  assert(config.catalog().roles_size() == 2);
  assert(config.catalog().roles(0).unique());
  assert(!config.catalog().roles(1).unique());
  assert(config.catalog().exclusion_groups_size() == 1);
  assert(config.catalog().exclusion_groups(0).roles_size() == 2);

  assert(config.locations_size() == 2);
  assert(!config.locations(0).has_active());
  assert(config.locations(1).has_active());
  assert(!config.locations(1).active());

  assert(config.schedule().event_weekday() == "sunday");
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.catalog().roles_size() == 0);
  assert(config.server().bind_address().empty());
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMalformedInputIsRejected() {
  bool not_a_map = false;
  try {
    (void)ConfigLoader::LoadFromYamlString("- just\n- a list\n");
  } catch (const std::runtime_error&) {
    not_a_map = true;
  }
  assert(not_a_map);

  bool bad_enum = false;
  try {
    (void)ConfigLoader::LoadFromYamlString("engine:\n  reassign_policy: SOMETIMES\n");
  } catch (const std::runtime_error&) {
    bad_enum = true;
  }
  assert(bad_enum);

  bool missing_file = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/roster.yaml");
  } catch (const std::runtime_error&) {
    missing_file = true;
  }
  assert(missing_file);
}

void TestExampleConfigLoads() {
  auto config = ConfigLoader::LoadFromYaml(ROSTER_EXAMPLE_CONFIG);
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_sqlite());
  assert(config.catalog().roles_size() == 12);
  assert(config.catalog().roles(1).code() == "volunteer_coordinator");
  assert(config.catalog().roles(1).unique());
  assert(config.catalog().exclusion_groups_size() == 2);
  assert(config.catalog().exclusion_groups(0).roles_size() == 3);
  assert(config.locations_size() == 3);

  // the shipped catalogue is a valid one
  roster::db::memory::MemoryRepository repo;
  roster::catalog::SeedCatalog(repo, config.catalog());
  auto catalog = roster::catalog::RoleCatalog::Load(repo);
  assert(catalog->Roles().size() == 12);
  assert(catalog->Find("Warm-up").has_value());
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestQuotedScalarsStayStrings();
  TestCatalogAndEngineSections();
  TestEmptyDocumentYieldsDefaults();
  TestUnknownFieldsAreRejected();
  TestMalformedInputIsRejected();
  TestExampleConfigLoads();

  std::cout << "roster_unit_config_loader: pass\n";
  return 0;
}
