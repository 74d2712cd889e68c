#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using piecework::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "piecework_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full", R"(database:
  sqlite:
    path: "C:\\piecework\\\"quoted\"\\db.sqlite"
    busy_timeout_ms: 2500
logging:
  level: debug
settlement:
  rubric:
    daily_target: "1.50"
    secondary_per_primary: "60"
  currency_places: 0
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "C:\\piecework\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().busy_timeout_ms() == 2500);
  assert(config.logging().level() == "debug");
  // quoted decimals keep their exact text
  assert(config.settlement().rubric().daily_target() == "1.50");
  assert(config.settlement().has_currency_places());
  assert(config.settlement().currency_places() == 0);
}

void TestBareDecimalsLoadAsText() {
  auto config = ConfigLoader::LoadFromString(R"(settlement:
  rubric:
    daily_target: 1.50
    secondary_per_primary: 60
  currency_places: 2
)");
  assert(config.settlement().rubric().daily_target() == "1.50");
  assert(config.settlement().rubric().secondary_per_primary() == "60");
  assert(config.settlement().currency_places() == 2);

  // an unknown key under a known message is still rejected
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromString("settlement:\n  rubric:\n    weekly_target: 7\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestDefaultsWhenEmpty() {
  auto config = ConfigLoader::LoadFromString("");
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());
  assert(!config.settlement().has_currency_places());

  auto memory = ConfigLoader::LoadFromString("database:\n  memory: {}\n");
  assert(memory.database().has_memory());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(database:
  sqlite:
    path: "/tmp/data"
    wal_mode: false
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestNonMappingAndMissingFileAreRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromString("- a\n- b\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/piecework.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestBareDecimalsLoadAsText();
  TestDefaultsWhenEmpty();
  TestUnknownFieldsAreRejected();
  TestNonMappingAndMissingFileAreRejected();

  std::cout << "piecework_unit_config_loader: pass\n";
  return 0;
}
