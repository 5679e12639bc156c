#include "internal/planning/topological_sorter.hpp"

#include <algorithm>
#include <functional>
#include <queue>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace linksync::planning {

namespace obs = linksync::observability;

using model::ModelIdentity;

namespace {

std::vector<ModelIdentity> DistinctChildren(const graph::DependencyNode& node) {
  std::vector<ModelIdentity> children;
  for (const auto& child : node.children) {
    if (child == node.identity) continue;
    if (std::find(children.begin(), children.end(), child) == children.end()) {
      children.push_back(child);
    }
  }
  return children;
}

// Walks child edges among the nodes that never became eligible until a node repeats.
std::vector<ModelIdentity> FindCycle(const graph::DependencyGraph& graph, const std::vector<std::size_t>& remaining) {
  const auto& order = graph.DiscoveryOrder();

  std::unordered_set<ModelIdentity> stuck;
  for (auto index : remaining) {
    stuck.insert(order[index]);
  }

  auto next_stuck_child = [&](const ModelIdentity& id) -> const ModelIdentity* {
    const graph::DependencyNode* best = nullptr;
    for (const auto& child : graph.Node(id).children) {
      if (child == id || !stuck.count(child)) continue;
      const auto& candidate = graph.Node(child);
      if (!best || candidate.discovery_index < best->discovery_index) {
        best = &candidate;
      }
    }
    return best ? &best->identity : nullptr;
  };

  std::vector<ModelIdentity>                  path;
  std::unordered_map<ModelIdentity, std::size_t> position;

  // Every stuck node has at least one stuck child, so the walk must revisit a node.
  ModelIdentity current = order[remaining.front()];
  while (!position.count(current)) {
    position.emplace(current, path.size());
    path.push_back(current);

    const auto* next = next_stuck_child(current);
    if (!next) {
      throw std::logic_error("topological sort: stalled without a cycle at " + current.ToString());
    }
    current = *next;
  }

  std::vector<ModelIdentity> cycle(path.begin() + static_cast<std::ptrdiff_t>(position[current]), path.end());

  auto earliest = std::min_element(cycle.begin(), cycle.end(), [&](const ModelIdentity& a, const ModelIdentity& b) {
    return graph.Node(a).discovery_index < graph.Node(b).discovery_index;
  });
  std::rotate(cycle.begin(), earliest, cycle.end());
  return cycle;
}

} // namespace

std::vector<ModelIdentity> TopologicalSorter::Sort(const graph::DependencyGraph& graph) {
  if (!graph.Complete()) {
    throw std::logic_error("topological sort: graph has models that were never inspected");
  }

  const auto&       order = graph.DiscoveryOrder();
  const std::size_t size  = order.size();

  std::vector<std::size_t>              pending_children(size, 0);
  std::vector<std::vector<std::size_t>> parents(size);

  for (std::size_t i = 0; i < size; ++i) {
    const auto& node = graph.Node(order[i]);
    if (node.state == graph::DiscoveryState::kFailed) continue;

    for (const auto& child : DistinctChildren(node)) {
      const auto child_index = graph.Node(child).discovery_index;
      ++pending_children[i];
      parents[child_index].push_back(i);
    }
  }

  std::priority_queue<std::size_t, std::vector<std::size_t>, std::greater<>> eligible;
  for (std::size_t i = 0; i < size; ++i) {
    if (pending_children[i] == 0) eligible.push(i);
  }

  std::vector<ModelIdentity> sorted;
  sorted.reserve(size);
  std::vector<bool> placed(size, false);

  while (!eligible.empty()) {
    const auto index = eligible.top();
    eligible.pop();

    placed[index] = true;
    sorted.push_back(order[index]);

    for (auto parent : parents[index]) {
      if (--pending_children[parent] == 0) {
        eligible.push(parent);
      }
    }
  }

  if (sorted.size() != size) {
    std::vector<std::size_t> remaining;
    for (std::size_t i = 0; i < size; ++i) {
      if (!placed[i]) remaining.push_back(i);
    }

    auto cycle = FindCycle(graph, remaining);

    std::string names;
    for (const auto& member : cycle) {
      if (!names.empty()) names += " -> ";
      names += member.ToString();
    }
    LINKSYNC_LOG_ERROR("Circular model links", {obs::StringField("cycle", names)});
    throw util::CycleDetected("circular links: " + names, std::move(cycle));
  }

  return sorted;
}

} // namespace linksync::planning
