#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace roster::config {

using roster::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  // Quoted scalars ("08:00", "5432") stay strings.
  if (node.Tag() != "!") {
    char*        endptr        = nullptr;
    const double numeric_value = strtod(scalar_value.c_str(), &endptr);
    if (!scalar_value.empty() && endptr && *endptr == '\0') {
      value->set_number_value(numeric_value);
      return;
    }
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

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
    ConfigLoader::Validate(config);
    return config;
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

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

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
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50061");

  auto* database = config.mutable_database();
  if (database->backend_case() == roster::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }
  if (database->has_sqlite()) {
    auto* sqlite = database->mutable_sqlite();
    if (sqlite->busy_timeout_ms() == 0) sqlite->set_busy_timeout_ms(5000);
    if (sqlite->league_lock_stale_sec() == 0) sqlite->set_league_lock_stale_sec(600);
  }
  if (database->has_postgres()) {
    auto* postgres = database->mutable_postgres();
    if (postgres->max_connections() == 0) postgres->set_max_connections(16);
  }

  auto* defaults = config.mutable_league_defaults();
  if (defaults->max_roster_size() == 0) defaults->set_max_roster_size(22);
  if (defaults->cooldown_hours() == 0) defaults->set_cooldown_hours(48);
  if (defaults->priority_policy() == roster::runtime::config::PRIORITY_POLICY_UNSPECIFIED) {
    defaults->set_priority_policy(roster::runtime::config::PRIORITY_POLICY_ROTATING);
  }
  if (defaults->processing_time_utc().empty()) defaults->set_processing_time_utc("08:00");

  auto* claims = config.mutable_claim_processing();
  if (claims->poll_interval_sec() == 0) claims->set_poll_interval_sec(60);
  if (claims->batch_size() == 0) claims->set_batch_size(100);
  if (claims->processing_window_sec() == 0) claims->set_processing_window_sec(300);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }

  try {
    util::ParseTimeOfDay(config.league_defaults().processing_time_utc());
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error("Invalid configuration: league_defaults.processing_time_utc: " + std::string(e.what()));
  }

  if (config.claim_processing().batch_size() > 1000) {
    throw std::runtime_error("Invalid configuration: claim_processing.batch_size must be at most 1000");
  }
}

} // namespace roster::config
