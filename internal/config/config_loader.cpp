#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace devicefarm::config {

namespace {

using devicefarm::runtime::config::ClientConfig;

constexpr const char* kDefaultRegion         = "us-west-2";
constexpr const char* kDefaultUserAgent      = "devicefarm-client/1.0";
constexpr uint32_t    kDefaultTimeoutMs      = 300000;
constexpr uint32_t    kDefaultPollIntervalMs = 5000;
constexpr const char* kDefaultLogLevel       = "info";

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars carry the non-specific "!" tag
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

static ClientConfig ParseYaml(const YAML::Node& yaml) {
  ClientConfig config;

  if (yaml.IsDefined() && !yaml.IsNull()) {
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
  }

  ConfigLoader::ApplyDefaults(&config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

ClientConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

ClientConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(ClientConfig* config) {
  auto* aws = config->mutable_aws();
  if (aws->region().empty()) {
    aws->set_region(kDefaultRegion);
  }

  auto* http = config->mutable_http();
  if (http->user_agent().empty()) {
    http->set_user_agent(kDefaultUserAgent);
  }
  if (http->timeout_ms() == 0) {
    http->set_timeout_ms(kDefaultTimeoutMs);
  }
  if (!http->has_verify_tls()) {
    http->set_verify_tls(true);
  }

  auto* upload = config->mutable_upload();
  if (upload->poll_interval_ms() == 0) {
    upload->set_poll_interval_ms(kDefaultPollIntervalMs);
  }

  auto* logging = config->mutable_logging();
  if (logging->level().empty()) {
    logging->set_level(kDefaultLogLevel);
  }
}

void ConfigLoader::ApplyEnvironment(ClientConfig* config) {
  auto* aws = config->mutable_aws();

  if (const char* region = std::getenv("AWS_REGION")) {
    if (*region != '\0') {
      aws->set_region(region);
    }
  }

  auto* credentials = aws->mutable_credentials();
  if (credentials->access_key_id().empty() && credentials->secret_access_key().empty()) {
    const char* key_id = std::getenv("AWS_ACCESS_KEY_ID");
    const char* secret = std::getenv("AWS_SECRET_ACCESS_KEY");
    if (key_id != nullptr && secret != nullptr) {
      credentials->set_access_key_id(key_id);
      credentials->set_secret_access_key(secret);
      if (const char* token = std::getenv("AWS_SESSION_TOKEN")) {
        credentials->set_session_token(token);
      }
    }
  }
}

} // namespace devicefarm::config
