#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace datastream::config {

using datastream::runtime::config::RuntimeConfig;

namespace {

constexpr char     kDefaultBindAddress[]       = "0.0.0.0:50061";
constexpr uint32_t kDefaultRefreshIntervalMs   = 1000;
constexpr uint32_t kDefaultSessionTimeoutMs    = 30000;
constexpr uint32_t kDefaultConnectionTimeoutMs = 15000;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // Quoted scalars stay strings ("8080" is not a number).
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      // An empty mapping ("memory: {}" or a bare "memory:") selects a section with no fields.
      value->mutable_struct_value();
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }
  }
}

RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

void ApplyDefaultsAndValidate(RuntimeConfig& config) {
  if (config.cluster().name().empty()) {
    throw std::runtime_error("Invalid configuration: cluster.name is required");
  }
  if (config.cluster().name().find('/') != std::string::npos) {
    throw std::runtime_error("Invalid configuration: cluster.name must not contain '/'");
  }

  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  if (config.name_cache().refresh_interval_ms() == 0) {
    config.mutable_name_cache()->set_refresh_interval_ms(kDefaultRefreshIntervalMs);
  }

  auto* coordination = config.mutable_coordination();
  switch (coordination->backend_case()) {
    case datastream::runtime::config::CoordinationConfig::kSqlite:
      if (coordination->sqlite().path().empty()) {
        throw std::runtime_error("Invalid configuration: coordination.sqlite.path is required");
      }
      break;

    case datastream::runtime::config::CoordinationConfig::kZookeeper: {
      auto* zookeeper = coordination->mutable_zookeeper();
      if (zookeeper->connect_string().empty()) {
        throw std::runtime_error("Invalid configuration: coordination.zookeeper.connect_string is required");
      }
      if (zookeeper->session_timeout_ms() == 0) {
        zookeeper->set_session_timeout_ms(kDefaultSessionTimeoutMs);
      }
      if (zookeeper->connection_timeout_ms() == 0) {
        zookeeper->set_connection_timeout_ms(kDefaultConnectionTimeoutMs);
      }
      break;
    }

    case datastream::runtime::config::CoordinationConfig::kMemory:
      break;

    case datastream::runtime::config::CoordinationConfig::BACKEND_NOT_SET:
      coordination->mutable_memory();
      break;
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  auto config = ParseYaml(yaml);
  ApplyDefaultsAndValidate(config);
  return config;
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& content) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(content);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  auto config = ParseYaml(yaml);
  ApplyDefaultsAndValidate(config);
  return config;
}

} // namespace datastream::config
