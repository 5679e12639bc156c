#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/events/event_channel.hpp"
#include "internal/gateway/cloud_document_gateway.hpp"
#include "internal/graph/dependency_graph.hpp"
#include "internal/ledger/resource_ledger.hpp"
#include "internal/retry/retry_policy.hpp"
#include "internal/util/cancellation.hpp"

namespace linksync::discovery {

struct DiscoveryOptions {
  std::uint32_t      max_concurrent_opens{2};
  retry::RetryPolicy retry;
};

struct DiscoveryResult {
  graph::DependencyGraph graph;
  // Stopped early; nodes still Pending were never inspected.
  bool cancelled{false};
};

/*
  Breadth-first walk of the link graph using detached opens.

  Every identity is inspected at most once. A frontier level is inspected
  with up to max_concurrent_opens opens in flight, and results are merged
  back in frontier order, so node indices do not depend on timing.

  A node that cannot be opened becomes a Failed leaf. GatewayUnavailable
  ends the walk: the ledger is drained and the exception propagates.
*/
class DependencyDiscoverer {
 public:
  DependencyDiscoverer(gateway::CloudDocumentGatewayPtr gateway, std::shared_ptr<ledger::ResourceLedger> ledger,
                       std::shared_ptr<events::EventChannel> events, DiscoveryOptions options);

  // root_handle, when given, is the caller's already-open document; it is read but never closed.
  DiscoveryResult Discover(const model::ModelIdentity& root, const std::string& root_name,
                           const std::optional<gateway::DocumentHandle>& root_handle = std::nullopt,
                           const util::CancellationToken*                cancel      = nullptr);

 private:
  struct Inspection;

  Inspection Inspect(const model::ModelIdentity& id, const std::optional<gateway::DocumentHandle>& open_handle);
  void       Merge(graph::DependencyGraph& graph, const model::ModelIdentity& id, Inspection& inspection,
                   std::vector<model::ModelIdentity>& next);

  gateway::CloudDocumentGatewayPtr        gateway_;
  std::shared_ptr<ledger::ResourceLedger> ledger_;
  std::shared_ptr<events::EventChannel>   events_;
  DiscoveryOptions                        options_;
};

} // namespace linksync::discovery
