#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace linksync::config {

namespace pbconfig = linksync::runtime::config;

namespace {

constexpr std::uint32_t kDefaultConcurrency       = 2;
constexpr std::uint32_t kDefaultDiscoveryRetries  = 2;
constexpr std::uint32_t kDefaultLinkReloadDelayMs = 2000;

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
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

pbconfig::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  pbconfig::RuntimeConfig config;
  if (yaml.IsNull()) {
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

  return config;
}

// ------------------------------------------------------------
// Engine options
// ------------------------------------------------------------

sync::RunOptions ToRunOptions(const pbconfig::RuntimeConfig& config) {
  const auto& sync_config = config.sync();

  sync::RunOptions options;

  switch (sync_config.workset_opening_mode()) {
    case pbconfig::WORKSET_OPENING_MODE_UNSPECIFIED:
    case pbconfig::WORKSET_OPENING_MODE_ALL:
      options.document.workset_mode = gateway::WorksetOpeningMode::kAll;
      break;
    case pbconfig::WORKSET_OPENING_MODE_LAST_VIEWED:
      options.document.workset_mode = gateway::WorksetOpeningMode::kLastViewed;
      break;
    case pbconfig::WORKSET_OPENING_MODE_SPECIFY:
      options.document.workset_mode = gateway::WorksetOpeningMode::kSpecify;
      break;
    default:
      throw util::InvalidConfig("sync.workset_opening_mode: unknown value " + std::to_string(sync_config.workset_opening_mode()));
  }

  options.document.worksets.assign(sync_config.worksets().begin(), sync_config.worksets().end());
  if (options.document.workset_mode == gateway::WorksetOpeningMode::kSpecify && options.document.worksets.empty()) {
    throw util::InvalidConfig("sync.worksets must name at least one workset when workset_opening_mode is SPECIFY");
  }

  options.document.reload_links  = sync_config.has_reload_links() ? sync_config.reload_links() : true;
  options.document.reload_latest = sync_config.has_reload_latest() ? sync_config.reload_latest() : true;
  options.link_reload_delay      = std::chrono::milliseconds(
      sync_config.has_link_reload_delay_ms() ? sync_config.link_reload_delay_ms() : kDefaultLinkReloadDelayMs);

  options.max_concurrent_syncs = sync_config.max_concurrent_syncs() > 0 ? sync_config.max_concurrent_syncs() : kDefaultConcurrency;

  options.retry.max_retry_attempts = sync_config.max_retry_attempts();
  options.retry.backoff_base       = std::chrono::milliseconds(sync_config.retry_backoff_base_ms());
  options.retry.max_backoff        = std::chrono::milliseconds(sync_config.retry_backoff_max_ms());
  if (options.retry.max_backoff.count() > 0 && options.retry.max_backoff < options.retry.backoff_base) {
    throw util::InvalidConfig("sync.retry_backoff_max_ms must not be below sync.retry_backoff_base_ms");
  }

  return options;
}

discovery::DiscoveryOptions ToDiscoveryOptions(const pbconfig::RuntimeConfig& config) {
  const auto& discovery_config = config.discovery();

  discovery::DiscoveryOptions options;
  options.max_concurrent_opens =
      discovery_config.max_concurrent_opens() > 0 ? discovery_config.max_concurrent_opens() : kDefaultConcurrency;

  options.retry.max_retry_attempts =
      discovery_config.has_max_retry_attempts() ? discovery_config.max_retry_attempts() : kDefaultDiscoveryRetries;
  options.retry.backoff_base = std::chrono::milliseconds(config.sync().retry_backoff_base_ms());
  options.retry.max_backoff  = std::chrono::milliseconds(config.sync().retry_backoff_max_ms());

  return options;
}

} // namespace linksync::config
