#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/model/error_kind.hpp"
#include "internal/model/model_identity.hpp"

namespace linksync::graph {

enum class DiscoveryState : std::uint8_t {
  kPending,
  kDiscovering,
  kDiscovered,
  kFailed,
};

std::string_view ToString(DiscoveryState state);

struct DependencyNode {
  DependencyNode(model::ModelIdentity id, std::string display_name, std::size_t index)
      : identity(std::move(id)), name(std::move(display_name)), discovery_index(index) {
  }

  model::ModelIdentity identity;
  std::string          name;
  std::size_t          discovery_index;
  DiscoveryState       state{DiscoveryState::kPending};

  // Direct links, de-duplicated, in first-seen order.
  std::vector<model::ModelIdentity> children;

  std::optional<model::ErrorKind> error;
  std::string                     error_message;
  std::vector<std::string>        skipped_links;

  bool Settled() const {
    return state == DiscoveryState::kDiscovered || state == DiscoveryState::kFailed;
  }
};

struct TreeRow {
  std::size_t          depth;
  model::ModelIdentity identity;
  std::string          name;
  DiscoveryState       state;
  // Already printed higher up on the same path; children not expanded.
  bool                 repeated;
};

/*
  Directed "parent links child" graph of cloud models.

  Nodes are keyed by identity and remember the order in which they were
  first discovered. Node contents can only change until the node is
  settled (Discovered or Failed).
*/
class DependencyGraph {
 public:
  DependencyGraph(model::ModelIdentity root, std::string root_name);

  const model::ModelIdentity& Root() const {
    return root_;
  }

  // Adds a Pending node. Returns false if the identity is already known.
  bool Insert(const model::ModelIdentity& id, std::string name);

  void MarkDiscovering(const model::ModelIdentity& id);
  void RecordLinks(const model::ModelIdentity& id, const std::vector<model::ModelIdentity>& children, std::vector<std::string> skipped);
  void MarkDiscovered(const model::ModelIdentity& id);
  void MarkFailed(const model::ModelIdentity& id, model::ErrorKind kind, std::string message);

  bool                  Contains(const model::ModelIdentity& id) const;
  const DependencyNode& Node(const model::ModelIdentity& id) const;
  std::size_t           Size() const {
    return order_.size();
  }

  // Identities in first-discovered order.
  const std::vector<model::ModelIdentity>& DiscoveryOrder() const {
    return order_;
  }

  std::vector<model::ModelIdentity> Parents(const model::ModelIdentity& id) const;

  // True once every node is Discovered or Failed.
  bool Complete() const;

  // Depth-first rows from the root, for display.
  std::vector<TreeRow> FormatTree() const;

 private:
  DependencyNode& Mutable(const model::ModelIdentity& id);

  model::ModelIdentity                                                          root_;
  std::unordered_map<model::ModelIdentity, DependencyNode>                      nodes_;
  std::vector<model::ModelIdentity>                                             order_;
  std::unordered_map<model::ModelIdentity, std::vector<model::ModelIdentity>> parents_;
};

} // namespace linksync::graph
