#include "internal/graph/dependency_graph.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "internal/util/errors.hpp"

namespace linksync::graph {

using model::ModelIdentity;

std::string_view ToString(DiscoveryState state) {
  switch (state) {
    case DiscoveryState::kPending:
      return "Pending";
    case DiscoveryState::kDiscovering:
      return "Discovering";
    case DiscoveryState::kDiscovered:
      return "Discovered";
    case DiscoveryState::kFailed:
      return "Failed";
  }
  return "Unknown";
}

DependencyGraph::DependencyGraph(ModelIdentity root, std::string root_name) : root_(root) {
  Insert(root, std::move(root_name));
}

bool DependencyGraph::Insert(const ModelIdentity& id, std::string name) {
  if (nodes_.count(id)) {
    return false;
  }

  nodes_.emplace(id, DependencyNode(id, std::move(name), order_.size()));
  order_.push_back(id);
  return true;
}

DependencyNode& DependencyGraph::Mutable(const ModelIdentity& id) {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) {
    throw util::NotFound("dependency graph: unknown model " + id.ToString());
  }
  if (it->second.Settled()) {
    throw std::logic_error("dependency graph: node already settled " + id.ToString());
  }
  return it->second;
}

void DependencyGraph::MarkDiscovering(const ModelIdentity& id) {
  Mutable(id).state = DiscoveryState::kDiscovering;
}

void DependencyGraph::RecordLinks(const ModelIdentity& id, const std::vector<ModelIdentity>& children, std::vector<std::string> skipped) {
  auto& node = Mutable(id);

  for (const auto& child : children) {
    if (std::find(node.children.begin(), node.children.end(), child) != node.children.end()) {
      continue;
    }
    node.children.push_back(child);
    parents_[child].push_back(id);
  }

  node.skipped_links = std::move(skipped);
}

void DependencyGraph::MarkDiscovered(const ModelIdentity& id) {
  Mutable(id).state = DiscoveryState::kDiscovered;
}

void DependencyGraph::MarkFailed(const ModelIdentity& id, model::ErrorKind kind, std::string message) {
  auto& node         = Mutable(id);
  node.state         = DiscoveryState::kFailed;
  node.error         = kind;
  node.error_message = std::move(message);
}

bool DependencyGraph::Contains(const ModelIdentity& id) const {
  return nodes_.count(id) > 0;
}

const DependencyNode& DependencyGraph::Node(const ModelIdentity& id) const {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) {
    throw util::NotFound("dependency graph: unknown model " + id.ToString());
  }
  return it->second;
}

std::vector<ModelIdentity> DependencyGraph::Parents(const ModelIdentity& id) const {
  auto it = parents_.find(id);
  if (it == parents_.end()) return {};
  return it->second;
}

bool DependencyGraph::Complete() const {
  return std::all_of(nodes_.begin(), nodes_.end(), [](const auto& entry) { return entry.second.Settled(); });
}

std::vector<TreeRow> DependencyGraph::FormatTree() const {
  struct Frame {
    ModelIdentity id;
    std::size_t   depth;
    bool          leaving;
  };

  std::vector<TreeRow>              rows;
  std::vector<Frame>                stack{{root_, 0, false}};
  std::unordered_set<ModelIdentity> on_path;

  while (!stack.empty()) {
    Frame frame = stack.back();
    stack.pop_back();

    if (frame.leaving) {
      on_path.erase(frame.id);
      continue;
    }

    const auto& node     = Node(frame.id);
    const bool  repeated = on_path.count(frame.id) > 0;
    rows.push_back({frame.depth, node.identity, node.name, node.state, repeated});
    if (repeated) {
      continue;
    }

    on_path.insert(frame.id);
    stack.push_back({frame.id, frame.depth, true});
    for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
      stack.push_back({*it, frame.depth + 1, false});
    }
  }

  return rows;
}

} // namespace linksync::graph
