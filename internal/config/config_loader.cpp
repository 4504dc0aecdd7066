#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace eventstore::config {

using eventstore::runtime::config::RuntimeConfig;

namespace {

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  // quoted scalars stay strings: "3" must not become a number
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  char*        endptr  = nullptr;
  const double numeric = strtod(scalar.c_str(), &endptr);
  if (!scalar.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric);
    return;
  }

  value->set_string_value(scalar);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*fields)[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  // empty document = all defaults
  if (yaml.IsNull()) {
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
    throw std::runtime_error("Failed to serialize YAML to JSON: " + to_json_status.ToString());
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + status.ToString());
  }

  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

retry::RetryOptions ToRetryOptions(const eventstore::runtime::config::RetryConfig& config) {
  retry::RetryOptions options;

  if (config.max_attempts() > 0) {
    options.max_attempts = config.max_attempts();
  }

  switch (config.backoff()) {
    case eventstore::runtime::config::BACKOFF_KIND_FIXED:
      options.backoff = retry::BackoffKind::kFixed;
      break;
    case eventstore::runtime::config::BACKOFF_KIND_EXPONENTIAL:
      options.backoff = retry::BackoffKind::kExponential;
      break;
    default:
      break;
  }

  if (config.initial_delay_ms() > 0) {
    options.initial_delay = std::chrono::milliseconds(config.initial_delay_ms());
  }
  if (config.max_delay_ms() > 0) {
    options.max_delay = std::chrono::milliseconds(config.max_delay_ms());
  }
  if (config.multiplier() > 0.0) {
    options.multiplier = config.multiplier();
  }

  if (options.max_delay < options.initial_delay) {
    throw std::runtime_error("Invalid configuration: retry.max_delay_ms is below retry.initial_delay_ms");
  }
  return options;
}

} // namespace eventstore::config
