#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace portwatch::config {

namespace {

constexpr const char* kDefaultHostId      = "local";
constexpr uint32_t    kDefaultInterval    = 60;
constexpr uint32_t    kMaxInterval        = 86400;
constexpr const char* kDefaultProcRoot    = "/proc";
constexpr const char* kDefaultCommand     = "witr";
constexpr uint32_t    kDefaultTimeoutMs   = 2000;
constexpr uint32_t    kMaxTimeoutMs       = 60000;
constexpr uint32_t    kDefaultOutputBytes = 64 * 1024;
constexpr const char* kDefaultBind        = "127.0.0.1:2008";

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars ("8080", 'true') stay strings
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

static portwatch::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  portwatch::runtime::config::RuntimeConfig config;

  // an empty document means "all defaults"
  if (yaml.IsNull()) {
    ConfigLoader::Validate(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

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

  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

portwatch::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

portwatch::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::Validate(portwatch::runtime::config::RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) {
    server->set_bind_address(kDefaultBind);
  }

  auto* collector = config.mutable_collector();
  if (collector->host_id().empty()) {
    collector->set_host_id(kDefaultHostId);
  }
  if (collector->interval_seconds() == 0) {
    collector->set_interval_seconds(kDefaultInterval);
  }
  if (collector->interval_seconds() > kMaxInterval) {
    throw std::runtime_error("Invalid configuration: collector.interval_seconds must be in 1..86400");
  }
  if (!collector->has_run_on_start()) {
    collector->set_run_on_start(true);
  }
  if (collector->proc_root().empty()) {
    collector->set_proc_root(kDefaultProcRoot);
  }

  auto* diagnostics = config.mutable_diagnostics();
  if (diagnostics->command().empty()) {
    diagnostics->set_command(kDefaultCommand);
  }
  if (diagnostics->timeout_ms() == 0) {
    diagnostics->set_timeout_ms(kDefaultTimeoutMs);
  }
  if (diagnostics->timeout_ms() > kMaxTimeoutMs) {
    throw std::runtime_error("Invalid configuration: diagnostics.timeout_ms must be at most 60000");
  }
  if (diagnostics->max_output_bytes() == 0) {
    diagnostics->set_max_output_bytes(kDefaultOutputBytes);
  }

  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }

  const auto& level = config.logging().level();
  if (!level.empty() && spdlog::level::from_str(level) == spdlog::level::off && level != "off") {
    throw std::runtime_error("Invalid configuration: unknown logging.level '" + level + "'");
  }
}

} // namespace portwatch::config
