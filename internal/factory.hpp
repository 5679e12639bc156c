#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/discovery/dependency_discoverer.hpp"
#include "internal/events/event_channel.hpp"
#include "internal/gateway/memory/memory_gateway.hpp"
#include "internal/ledger/resource_ledger.hpp"
#include "internal/sync/run_options.hpp"
#include "internal/sync/sync_orchestrator.hpp"

namespace linksync::factory {

/*
  Application

  Owns the gateway and the engine components built on top of it.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<gateway::memory::MemoryGateway> gateway;
  std::shared_ptr<ledger::ResourceLedger>         ledger;
  std::shared_ptr<events::EventChannel>           events;

  std::unique_ptr<discovery::DependencyDiscoverer> discoverer;
  std::unique_ptr<sync::SyncOrchestrator>          orchestrator;

  discovery::DiscoveryOptions discovery_options;
  sync::RunOptions            run_options;
};

/*
  Build

  Composition root. Loads the model catalog named by catalog.path into an
  in-process gateway and wires discovery and sync to it. Throws on invalid
  configuration or an unreadable catalog.
*/
Application Build(const linksync::runtime::config::RuntimeConfig& config);

} // namespace linksync::factory
