#pragma once

#include <string>
#include <vector>

#include <google/protobuf/message.h>

#include "api/linksync/v1.hpp"
#include "internal/graph/dependency_graph.hpp"
#include "internal/sync/sync_orchestrator.hpp"

namespace linksync::report {

linksync::v1::ModelRef       ToModelRef(const model::ModelIdentity& id, const std::string& name = {});
linksync::v1::ErrorKind      ToProto(model::ErrorKind kind);
linksync::v1::TaskState      ToProto(model::TaskState state);
linksync::v1::DiscoveryState ToProto(graph::DiscoveryState state);
linksync::v1::RunStatus      ToProto(sync::RunStatus status);

// order and cycle may be empty (not sorted yet, or no cycle).
linksync::v1::DiscoveryReport BuildDiscoveryReport(const graph::DependencyGraph& graph, bool cancelled,
                                                   const std::vector<model::ModelIdentity>& order,
                                                   const std::vector<model::ModelIdentity>& cycle);

linksync::v1::SyncReport BuildSyncReport(const sync::RunResult& result);

// Indented link tree followed by the sync order or the cycle.
std::string FormatDiscoverySummary(const graph::DependencyGraph& graph, const std::vector<model::ModelIdentity>& order,
                                   const std::vector<model::ModelIdentity>& cycle);

/*
  Terminal summary of a sync run: one line per model with its final state,
  the error kind for Failed and Skipped models, and for Skipped models the
  failure that caused the skip. Explicit and implicit models are listed
  separately.
*/
std::string FormatSyncSummary(const sync::RunResult& result);

// Throws std::runtime_error if protobuf cannot render the message.
std::string ToJson(const google::protobuf::Message& message);

} // namespace linksync::report
