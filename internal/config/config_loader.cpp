#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "internal/lock/advisory_lock.hpp"
#include "internal/probe/online_classifier.hpp"

namespace hsm::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
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

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
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

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

hsm::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  hsm::runtime::config::RuntimeConfig config;

  // An empty document is a valid "all defaults" config.
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(config);
  return config;
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ApplyDefaults(hsm::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* backend = config.mutable_hsm();
  if (!backend->has_min_file_size_bytes()) {
    backend->set_min_file_size_bytes(hsm::probe::kDefaultMinFileSizeBytes);
  }
  if (backend->storage_classes().empty()) {
    for (const char* storage_class : kDefaultStorageClasses) {
      backend->add_storage_classes(storage_class);
    }
  }
  if (backend->probe_strategy().empty()) {
    backend->set_probe_strategy(kDefaultProbeStrategy);
  }
  if (backend->stat_program().empty()) {
    backend->set_stat_program(kDefaultStatProgram);
  }

  auto* locks = config.mutable_locks();
  if (locks->cache().empty()) {
    locks->set_cache(kDefaultLockCache);
  }
  if (locks->ttl_seconds() == 0) {
    locks->set_ttl_seconds(static_cast<uint32_t>(hsm::lock::kDefaultLockTtl.count()));
  }
  if (!locks->has_safety_margin_seconds()) {
    locks->set_safety_margin_seconds(static_cast<uint32_t>(hsm::lock::kDefaultSafetyMargin.count()));
  }

  if (config.status().datafile_namespace().empty()) {
    config.mutable_status()->set_datafile_namespace(kDefaultDatafileNamespace);
  }

  if (config.sweep().batch_size() == 0) {
    config.mutable_sweep()->set_batch_size(kDefaultSweepBatchSize);
  }
}

hsm::runtime::config::RuntimeConfig DefaultConfig() {
  hsm::runtime::config::RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

} // namespace hsm::config
