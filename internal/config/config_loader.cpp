#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <array>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "internal/util/errors.hpp"

namespace waypoint::config {

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

// spdlog maps unknown names to "off", so they are rejected here instead.
static bool IsLogLevel(const std::string& level) {
  static constexpr std::array<std::string_view, 9> kLevels = {"trace", "debug", "info", "warn", "warning", "err", "error", "critical", "off"};
  for (auto known : kLevels) {
    if (level == known) return true;
  }
  return false;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

waypoint::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return FromNode(yaml);
}

waypoint::runtime::config::RuntimeConfig ConfigLoader::ParseYaml(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return FromNode(yaml);
}

waypoint::runtime::config::RuntimeConfig ConfigLoader::FromNode(const YAML::Node& yaml) {
  if (!yaml || yaml.IsNull()) {
    return {};
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  waypoint::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  Validate(config);
  return config;
}

void ConfigLoader::Validate(const waypoint::runtime::config::RuntimeConfig& config) {
  const auto& level = config.logging().level();
  if (!level.empty() && !IsLogLevel(level)) {
    throw util::InvalidArgument("logging.level: unknown level '" + level + "'");
  }

  const auto& database = config.database();
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw util::InvalidArgument("database.postgres.connection_uri is required");
  }
  if (database.has_sqlite() && database.sqlite().wal_mode()) {
    const auto& path = database.sqlite().path();
    if (path.empty() || path == ":memory:") {
      throw util::InvalidArgument("database.sqlite.wal_mode requires a file path");
    }
  }
}

} // namespace waypoint::config
