#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

#include "internal/config/config_loader.hpp"
#include "internal/gateway/memory/catalog_loader.hpp"
#include "internal/observability/logging.hpp"

namespace linksync::factory {

namespace obs = linksync::observability;

namespace {

std::shared_ptr<gateway::memory::MemoryGateway> BuildGateway(const linksync::runtime::config::RuntimeConfig& config) {
  const auto& catalog = config.catalog();
  if (catalog.path().empty()) {
    throw std::runtime_error("catalog.path is required");
  }

  auto gateway = std::make_shared<gateway::memory::MemoryGateway>();
  gateway::memory::CatalogLoader::LoadFromYaml(catalog.path(), *gateway);
  gateway->SetLatency(std::chrono::milliseconds(catalog.simulated_latency_ms()));
  return gateway;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const linksync::runtime::config::RuntimeConfig& config) {
  Application app;

  app.discovery_options = config::ToDiscoveryOptions(config);
  app.run_options       = config::ToRunOptions(config);

  // ------------------------------------------------------------------
  // Gateway and shared bookkeeping
  // ------------------------------------------------------------------
  app.gateway = BuildGateway(config);
  app.ledger  = std::make_shared<ledger::ResourceLedger>(app.gateway);
  app.events  = std::make_shared<events::EventChannel>();

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  app.discoverer   = std::make_unique<discovery::DependencyDiscoverer>(app.gateway, app.ledger, app.events, app.discovery_options);
  app.orchestrator = std::make_unique<sync::SyncOrchestrator>(app.gateway, app.ledger, app.events);

  LINKSYNC_LOG_INFO("Runtime assembled", {obs::IntField("discovery_concurrency", app.discovery_options.max_concurrent_opens),
                                          obs::IntField("sync_concurrency", app.run_options.max_concurrent_syncs),
                                          obs::StringField("worksets", gateway::ToString(app.run_options.document.workset_mode))});
  return app;
}

} // namespace linksync::factory
