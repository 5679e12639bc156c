#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/graph/dependency_graph.hpp"
#include "internal/model/error_kind.hpp"

namespace linksync::planning {

struct PlanEntry {
  model::ModelIdentity identity;
  std::string          name;

  // Pulled in as a dependency of a selected model, not selected itself.
  bool implicit{false};

  // Set when the model could not be inspected; such an entry is never opened.
  std::optional<model::ErrorKind> discovery_error;
  std::string                     discovery_error_message;

  // Distinct non-self children; all of them are plan members.
  std::vector<model::ModelIdentity> children;
};

struct SyncPlan {
  // Leaf first.
  std::vector<PlanEntry> entries;

  std::size_t      ExplicitCount() const;
  std::size_t      ImplicitCount() const;
  const PlanEntry* Find(const model::ModelIdentity& id) const;
};

/*
  Restricts a sorted order to the selection and everything it depends on.

  Throws util::InvalidSelection when a selected identity is not in the graph.
*/
SyncPlan BuildPlan(const graph::DependencyGraph& graph, const std::vector<model::ModelIdentity>& order,
                   const std::vector<model::ModelIdentity>& selection);

} // namespace linksync::planning
