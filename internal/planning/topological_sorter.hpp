#pragma once

#include <vector>

#include "internal/graph/dependency_graph.hpp"

namespace linksync::planning {

/*
  Leaf-to-root ordering of a settled dependency graph.

  Kahn elimination: a node becomes eligible once all its distinct non-self
  children are placed. Among eligible nodes the lowest discovery index goes
  first, so the result is a pure function of the graph. Failed nodes have
  no children and are placed as leaves.

  Throws util::CycleDetected naming one cycle, starting from its earliest
  discovered member. Throws std::logic_error if the graph still has
  unsettled nodes.
*/
class TopologicalSorter {
 public:
  static std::vector<model::ModelIdentity> Sort(const graph::DependencyGraph& graph);
};

} // namespace linksync::planning
