#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using datastream::config::ConfigLoader;
using datastream::runtime::config::CoordinationConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "datastream_store_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool LoadFails(const std::string& yaml, const std::string& expected_fragment) {
  try {
    ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error& e) {
    return std::string(e.what()).find(expected_fragment) != std::string::npos;
  }
  return false;
}

void TestMinimalConfigGetsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("cluster:\n  name: prod\n");

  assert(config.cluster().name() == "prod");
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.name_cache().refresh_interval_ms() == 1000);
  assert(config.coordination().backend_case() == CoordinationConfig::kMemory);
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("zookeeper",
                                   R"(server:
  bind_address: "127.0.0.1:7000"
cluster:
  name: brooklin
coordination:
  zookeeper:
    connect_string: "zk1:2181,zk2:2181/datastream"
    session_timeout_ms: 10000
name_cache:
  refresh_interval_ms: 250
logging:
  level: debug
  pattern: "%v"
observability:
  tracing_enabled: false
  metrics_enabled: true
  otlp_endpoint: "localhost:4317"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:7000");
  assert(config.coordination().backend_case() == CoordinationConfig::kZookeeper);
  assert(config.coordination().zookeeper().connect_string() == "zk1:2181,zk2:2181/datastream");
  assert(config.coordination().zookeeper().session_timeout_ms() == 10000);
  assert(config.coordination().zookeeper().connection_timeout_ms() == 15000);
  assert(config.name_cache().refresh_interval_ms() == 250);
  assert(config.logging().level() == "debug");
  assert(config.observability().metrics_enabled());
}

void TestEmptyMemorySectionSelectsMemoryBackend() {
  auto config = ConfigLoader::LoadFromYamlString("cluster:\n  name: c\ncoordination:\n  memory: {}\n");
  assert(config.coordination().backend_case() == CoordinationConfig::kMemory);
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString("cluster:\n  name: \"2024\"\n");
  assert(config.cluster().name() == "2024");
}

void TestSqliteBackend() {
  auto config = ConfigLoader::LoadFromYamlString(R"(cluster:
  name: c
coordination:
  sqlite:
    path: "/tmp/c.db"
    wal_mode: true
)");
  assert(config.coordination().backend_case() == CoordinationConfig::kSqlite);
  assert(config.coordination().sqlite().path() == "/tmp/c.db");
  assert(config.coordination().sqlite().wal_mode());
}

void TestValidationErrors() {
  assert(LoadFails("server:\n  bind_address: \"x:1\"\n", "cluster.name is required"));
  assert(LoadFails("cluster:\n  name: a/b\n", "must not contain '/'"));
  assert(LoadFails("cluster:\n  name: c\ncoordination:\n  sqlite:\n    wal_mode: true\n", "coordination.sqlite.path is required"));
  assert(LoadFails("cluster:\n  name: c\ncoordination:\n  zookeeper:\n    session_timeout_ms: 5\n", "connect_string is required"));
  assert(LoadFails("cluster:\n  name: c\nunknown_section:\n  x: 1\n", "Invalid configuration"));
}

void TestMissingFile() {
  try {
    ConfigLoader::LoadFromYaml("/nonexistent/datastream-store.yaml");
    assert(false && "expected failure");
  } catch (const std::runtime_error& e) {
    assert(std::string(e.what()).find("Failed to load YAML config") != std::string::npos);
  }
}

} // namespace

int main() {
  TestMinimalConfigGetsDefaults();
  TestFullConfigFromFile();
  TestEmptyMemorySectionSelectsMemoryBackend();
  TestQuotedNumbersStayStrings();
  TestSqliteBackend();
  TestValidationErrors();
  TestMissingFile();

  std::cout << "datastream_store_unit_config_loader: pass\n";
  return 0;
}
