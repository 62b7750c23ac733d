#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace fleet::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

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

// `embedded` -> `INGEST_MODE_EMBEDDED`; full enum names pass through.
static void NormalizeEnum(google::protobuf::Value* root, const std::string& section, const std::string& field,
                          const std::string& enum_prefix) {
  if (!root->has_struct_value()) return;
  auto& sections = *root->mutable_struct_value()->mutable_fields();
  auto  sit      = sections.find(section);
  if (sit == sections.end() || !sit->second.has_struct_value()) return;

  auto& fields = *sit->second.mutable_struct_value()->mutable_fields();
  auto  fit    = fields.find(field);
  if (fit == fields.end() || fit->second.kind_case() != google::protobuf::Value::kStringValue) return;

  std::string name = fit->second.string_value();
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (name.rfind(enum_prefix, 0) != 0) {
    name = enum_prefix + name;
  }
  fit->second.set_string_value(name);
}

static fleet::runtime::config::RuntimeConfig Parse(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);
  NormalizeEnum(&json_value, "ingest", "mode", "INGEST_MODE_");

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  fleet::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

fleet::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

fleet::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

void ConfigLoader::ApplyDefaults(fleet::runtime::config::RuntimeConfig& config) {
  using fleet::runtime::config::INGEST_MODE_EMBEDDED;
  using fleet::runtime::config::INGEST_MODE_UNSPECIFIED;

  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* ingest = config.mutable_ingest();
  if (ingest->mode() == INGEST_MODE_UNSPECIFIED) ingest->set_mode(INGEST_MODE_EMBEDDED);
  if (ingest->bind_address().empty()) ingest->set_bind_address(kDefaultIngestAddress);
  if (ingest->purge_interval_sec() == 0) ingest->set_purge_interval_sec(kDefaultPurgeIntervalSec);

  if (config.database().has_postgres() && config.database().postgres().pool_size() == 0) {
    config.mutable_database()->mutable_postgres()->set_pool_size(1);
  }

  if (config.background_pool().threads() == 0) {
    config.mutable_background_pool()->set_threads(kDefaultPoolThreads);
  }

  auto* scheduler = config.mutable_scheduler();
  if (scheduler->sweep_interval_sec() == 0) scheduler->set_sweep_interval_sec(kDefaultSweepIntervalSec);
  if (scheduler->command_ttl_sec() == 0) scheduler->set_command_ttl_sec(kDefaultCommandTtlSec);
  if (scheduler->stale_claim_sec() == 0) scheduler->set_stale_claim_sec(kDefaultStaleClaimSec);

  if (config.logging().level().empty()) {
    config.mutable_logging()->set_level(kDefaultLogLevel);
  }
}

void ConfigLoader::Validate(const fleet::runtime::config::RuntimeConfig& config) {
  using fleet::runtime::config::INGEST_MODE_STANDALONE;

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }
  if (config.ingest().mode() == INGEST_MODE_STANDALONE &&
      config.ingest().bind_address() == config.server().bind_address()) {
    throw std::runtime_error("Invalid configuration: standalone ingest must not share server.bind_address");
  }
  if (config.ingest().mode() == INGEST_MODE_STANDALONE && !config.database().has_sqlite() &&
      !config.database().has_postgres()) {
    throw std::runtime_error("Invalid configuration: standalone ingest requires a shared database");
  }
}

} // namespace fleet::config
