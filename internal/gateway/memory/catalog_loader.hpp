#pragma once

#include <string>

#include "memory_gateway.hpp"

namespace YAML {
class Node;
}

namespace linksync::gateway::memory {

/*
  Fills a MemoryGateway from a YAML model catalog:

    models:
      - region: US
        project: 6f1c...
        model: 0a2b...
        name: Architecture
        worksets: [Shared Levels and Grids, Interior]
        links:
          - { project: 6f1c..., model: 9d3e... }   # region defaults to the parent's
        unresolved_links: ["C:/local/site.rvt"]
        faults:
          - { operation: open_full, error: locked, times: 1 }

  Throws std::runtime_error naming the offending entry.
*/
class CatalogLoader {
 public:
  static void LoadFromYaml(const std::string& path, MemoryGateway& gateway);
  static void Load(const YAML::Node& root, MemoryGateway& gateway);
};

// Accepts the ErrorKind names in snake_case ("transient_io", "locked", ...).
model::ErrorKind ParseErrorKind(const std::string& text);

} // namespace linksync::gateway::memory
