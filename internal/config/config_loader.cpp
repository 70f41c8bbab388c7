#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "internal/config/settings.hpp"

namespace autopilot::config {

namespace {

using autopilot::runtime::config::RuntimeConfig;

constexpr std::array<std::string_view, 7> kLogLevels = {"trace", "debug", "info", "warn", "error", "critical", "off"};

// Plain (unquoted) scalars carry the "?" tag; quoted ones carry "!".
bool IsQuoted(const YAML::Node& node) {
  return node.Tag() == "!";
}

void ScalarToValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& text = node.Scalar();
  if (IsQuoted(node)) {
    value->set_string_value(text);
    return;
  }

  if (text == "true" || text == "True" || text == "TRUE") {
    value->set_bool_value(true);
    return;
  }
  if (text == "false" || text == "False" || text == "FALSE") {
    value->set_bool_value(false);
    return;
  }
  if (text == "~" || text == "null") {
    value->set_null_value(google::protobuf::NULL_VALUE);
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  if (!text.empty() && end != nullptr && *end == '\0') {
    value->set_number_value(number);
    return;
  }

  value->set_string_value(text);
}

void NodeToValue(const YAML::Node& node, google::protobuf::Value* value, const std::string& where) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      ScalarToValue(node, value);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
        NodeToValue(node[i], list->add_values(), where + "[" + std::to_string(i) + "]");
      }
      return;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        if (!entry.first.IsScalar()) {
          throw std::runtime_error("non-scalar key under " + where);
        }
        const auto& key = entry.first.Scalar();
        NodeToValue(entry.second, &(*fields)[key], where.empty() ? key : where + "." + key);
      }
      return;
    }
  }
  throw std::runtime_error("unsupported YAML node at " + where);
}

RuntimeConfig ToRuntimeConfig(const YAML::Node& root, const std::string& source) {
  google::protobuf::Value tree;
  NodeToValue(root, &tree, "");

  // an empty document is an empty config
  if (tree.kind_case() == google::protobuf::Value::kNullValue) {
    tree.mutable_struct_value();
  }
  if (tree.kind_case() != google::protobuf::Value::kStructValue) {
    throw std::runtime_error(source + ": top level must be a mapping");
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(tree, &json);
  if (!status.ok()) {
    throw std::runtime_error(source + ": cannot convert YAML to JSON: " + std::string(status.message()));
  }

  RuntimeConfig                            config;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error(source + ": invalid configuration: " + std::string(status.message()));
  }
  return config;
}

void ValidateDatabase(const autopilot::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw std::invalid_argument("database.sqlite.path must not be empty");
  }
  if (database.has_postgres()) {
    if (database.postgres().connection_uri().empty()) {
      throw std::invalid_argument("database.postgres.connection_uri must not be empty");
    }
    if (database.postgres().max_connections() > 256) {
      throw std::invalid_argument("database.postgres.max_connections must be at most 256");
    }
  }
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("failed to load config " + path + ": " + e.what());
  }

  auto config = ToRuntimeConfig(root, path);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::ParseYaml(const std::string& yaml_text, const std::string& source) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("failed to parse config " + source + ": " + e.what());
  }

  auto config = ToRuntimeConfig(root, source);
  Validate(config);
  return config;
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  ValidateDatabase(config.database());

  if (config.has_server() && config.server().bind_address().empty()) {
    throw std::invalid_argument("server.bind_address must not be empty");
  }

  const auto& level = config.logging().level();
  if (!level.empty() && std::find(kLogLevels.begin(), kLogLevels.end(), level) == kLogLevels.end()) {
    throw std::invalid_argument("logging.level '" + level + "' is not a log level");
  }

  (void)BuildSettings(config);
}

} // namespace autopilot::config
