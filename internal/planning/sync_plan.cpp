#include "internal/planning/sync_plan.hpp"

#include <algorithm>
#include <deque>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace linksync::planning {

namespace obs = linksync::observability;

using model::ModelIdentity;

std::size_t SyncPlan::ExplicitCount() const {
  return static_cast<std::size_t>(std::count_if(entries.begin(), entries.end(), [](const PlanEntry& e) { return !e.implicit; }));
}

std::size_t SyncPlan::ImplicitCount() const {
  return entries.size() - ExplicitCount();
}

const PlanEntry* SyncPlan::Find(const ModelIdentity& id) const {
  for (const auto& entry : entries) {
    if (entry.identity == id) return &entry;
  }
  return nullptr;
}

SyncPlan BuildPlan(const graph::DependencyGraph& graph, const std::vector<ModelIdentity>& order, const std::vector<ModelIdentity>& selection) {
  std::unordered_set<ModelIdentity> selected;
  for (const auto& id : selection) {
    if (!graph.Contains(id)) {
      throw util::InvalidSelection("selected model is not linked from the root: " + id.ToString());
    }
    selected.insert(id);
  }

  std::unordered_set<ModelIdentity> closure(selected.begin(), selected.end());
  std::deque<ModelIdentity>         worklist(selected.begin(), selected.end());
  while (!worklist.empty()) {
    const auto id = worklist.front();
    worklist.pop_front();

    for (const auto& child : graph.Node(id).children) {
      if (closure.insert(child).second) {
        worklist.push_back(child);
      }
    }
  }

  SyncPlan plan;
  for (const auto& id : order) {
    if (!closure.count(id)) continue;

    const auto& node = graph.Node(id);

    PlanEntry entry{id, node.name};
    entry.implicit = !selected.count(id);
    if (node.state == graph::DiscoveryState::kFailed) {
      entry.discovery_error         = node.error;
      entry.discovery_error_message = node.error_message;
    }
    for (const auto& child : node.children) {
      if (child == id) continue;
      if (std::find(entry.children.begin(), entry.children.end(), child) == entry.children.end()) {
        entry.children.push_back(child);
      }
    }

    plan.entries.push_back(std::move(entry));
  }

  if (plan.entries.size() != closure.size()) {
    throw util::InvalidSelection("sort order does not cover every selected model");
  }

  LINKSYNC_LOG_INFO("Sync plan built", {obs::IntField("explicit", static_cast<std::int64_t>(plan.ExplicitCount())),
                                        obs::IntField("implicit", static_cast<std::int64_t>(plan.ImplicitCount()))});
  return plan;
}

} // namespace linksync::planning
