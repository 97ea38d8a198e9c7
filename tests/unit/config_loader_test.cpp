#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "hsm_status_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
database:
  sqlite:
    path: "/var/lib/hsm/status.db"
hsm:
  min_file_size_bytes: 500
  storage_classes:
    - "custom.Storage"
  worker_threads: 4
  probe_strategy: command
  stat_program: /usr/bin/stat
  backends:
    - storage_box: tape
      checker: filesystem
      retriever: filesystem
locks:
  cache: database
  ttl_seconds: 60
  safety_margin_seconds: 5
status:
  datafile_namespace: "http://example.org/hsm"
sweep:
  interval_seconds: 3600
  batch_size: 100
observability:
  tracing_enabled: true
  transport: OTLP_TRANSPORT_HTTP
)");

  auto config = hsm::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().sqlite().path() == "/var/lib/hsm/status.db");
  assert(config.hsm().min_file_size_bytes() == 500);
  assert(config.hsm().storage_classes_size() == 1);
  assert(config.hsm().storage_classes(0) == "custom.Storage");
  assert(config.hsm().worker_threads() == 4);
  assert(config.hsm().probe_strategy() == "command");
  assert(config.hsm().backends_size() == 1);
  assert(config.hsm().backends(0).checker() == "filesystem");
  assert(config.locks().cache() == "database");
  assert(config.locks().ttl_seconds() == 60);
  assert(config.locks().safety_margin_seconds() == 5);
  assert(config.status().datafile_namespace() == "http://example.org/hsm");
  assert(config.sweep().interval_seconds() == 3600);
  assert(config.sweep().batch_size() == 100);
  assert(config.observability().tracing_enabled());
  assert(config.observability().transport() == hsm::runtime::config::OTLP_TRANSPORT_HTTP);
}

void TestEmptyConfigGetsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = hsm::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == hsm::config::kDefaultBindAddress);
  assert(!config.database().has_sqlite());
  assert(config.hsm().min_file_size_bytes() == 350);
  assert(config.hsm().storage_classes_size() == 2);
  assert(config.hsm().probe_strategy() == "auto");
  assert(config.locks().cache() == "memory");
  assert(config.locks().ttl_seconds() == 300);
  assert(config.locks().safety_margin_seconds() == 3);
  assert(config.status().datafile_namespace() == hsm::config::kDefaultDatafileNamespace);
  assert(config.sweep().batch_size() == 256);
  assert(config.sweep().interval_seconds() == 0);
}

void TestExplicitZeroesAreKept() {
  const auto yaml_path = WriteYaml("zeroes",
                                   R"(hsm:
  min_file_size_bytes: 0
locks:
  safety_margin_seconds: 0
)");

  auto config = hsm::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.hsm().min_file_size_bytes() == 0);
  assert(config.locks().safety_margin_seconds() == 0);
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_number",
                                   R"(database:
  sqlite:
    path: "12345"
)");

  auto config = hsm::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "12345");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(hsm:
  min_file_size_bytes: 350
  tape_library: "ibm"
)");

  bool threw = false;
  try {
    (void)hsm::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)hsm::config::ConfigLoader::LoadFromYaml("/nonexistent/hsm-status.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestEmptyConfigGetsDefaults();
  TestExplicitZeroesAreKept();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsRejected();

  std::cout << "hsm_status_unit_config_loader: pass\n";
  return 0;
}
