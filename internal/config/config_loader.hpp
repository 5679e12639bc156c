#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/discovery/dependency_discoverer.hpp"
#include "internal/sync/run_options.hpp"

namespace linksync::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static linksync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

// Fills in defaults and validates. Throws util::InvalidConfig.
sync::RunOptions            ToRunOptions(const linksync::runtime::config::RuntimeConfig& config);
discovery::DiscoveryOptions ToDiscoveryOptions(const linksync::runtime::config::RuntimeConfig& config);

} // namespace linksync::config
