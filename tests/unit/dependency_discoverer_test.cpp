#include "internal/discovery/dependency_discoverer.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/gateway/memory/memory_gateway.hpp"
#include "internal/util/errors.hpp"

namespace {

using linksync::discovery::DependencyDiscoverer;
using linksync::discovery::DiscoveryOptions;
using linksync::events::EventChannel;
using linksync::gateway::OpenMode;
using linksync::gateway::memory::MemoryGateway;
using linksync::gateway::memory::Operation;
using linksync::graph::DiscoveryState;
using linksync::ledger::ResourceLedger;
using linksync::model::ErrorKind;
using linksync::model::ModelIdentity;
using linksync::model::Region;

ModelIdentity Id(const std::string& model) {
  return ModelIdentity(Region::kEMEA, "proj", model);
}

struct Fixture {
  explicit Fixture(std::uint32_t concurrency = 2, std::uint32_t retries = 0) {
    gateway = std::make_shared<MemoryGateway>();
    ledger  = std::make_shared<ResourceLedger>(gateway);
    events  = std::make_shared<EventChannel>();

    DiscoveryOptions options;
    options.max_concurrent_opens     = concurrency;
    options.retry.max_retry_attempts = retries;
    discoverer                       = std::make_unique<DependencyDiscoverer>(gateway, ledger, events, options);
  }

  // R -> {A, B}, A -> C, B -> C
  void Diamond() {
    for (const auto* name : {"R", "A", "B", "C"}) gateway->AddModel(Id(name), name);
    gateway->AddLink(Id("R"), Id("A"));
    gateway->AddLink(Id("R"), Id("B"));
    gateway->AddLink(Id("A"), Id("C"));
    gateway->AddLink(Id("B"), Id("C"));
  }

  std::shared_ptr<MemoryGateway>         gateway;
  std::shared_ptr<ResourceLedger>        ledger;
  std::shared_ptr<EventChannel>          events;
  std::unique_ptr<DependencyDiscoverer> discoverer;
};

void TestSharedChildIsOpenedOnce() {
  Fixture f;
  f.Diamond();

  const auto result = f.discoverer->Discover(Id("R"), "R");
  assert(!result.cancelled);
  assert(result.graph.Size() == 4);
  assert(result.graph.Complete());
  assert((result.graph.DiscoveryOrder() == std::vector<ModelIdentity>{Id("R"), Id("A"), Id("B"), Id("C")}));
  assert((result.graph.Parents(Id("C")) == std::vector<ModelIdentity>{Id("A"), Id("B")}));

  assert(f.gateway->OpenCount(Id("C"), OpenMode::kDetached) == 1);
  assert(f.gateway->OpenCount(Id("C"), OpenMode::kFull) == 0);
  assert(f.gateway->TotalOpens() == 4);
  assert(f.gateway->TotalCloses() == 4);
  assert(f.gateway->OpenHandles() == 0);
  assert(f.gateway->RedundantCloses() == 0);
  assert(f.ledger->OpenCount() == 0);
}

void TestOrderDoesNotDependOnConcurrency() {
  std::vector<ModelIdentity> orders[2];
  const std::uint32_t        widths[2] = {1, 4};

  for (int i = 0; i < 2; ++i) {
    Fixture f(widths[i]);
    for (const auto* name : {"R", "A", "B", "C", "D", "E", "F"}) f.gateway->AddModel(Id(name), name);
    f.gateway->AddLink(Id("R"), Id("A"));
    f.gateway->AddLink(Id("R"), Id("B"));
    f.gateway->AddLink(Id("R"), Id("C"));
    f.gateway->AddLink(Id("A"), Id("F"));
    f.gateway->AddLink(Id("B"), Id("E"));
    f.gateway->AddLink(Id("C"), Id("D"));
    f.gateway->AddLink(Id("C"), Id("E"));
    f.gateway->SetLatency(std::chrono::milliseconds(2));

    orders[i] = f.discoverer->Discover(Id("R"), "R").graph.DiscoveryOrder();
    assert(f.gateway->PeakOpenHandles(OpenMode::kDetached) <= widths[i]);
  }

  assert(orders[0] == orders[1]);
  assert((orders[0] == std::vector<ModelIdentity>{Id("R"), Id("A"), Id("B"), Id("C"), Id("F"), Id("E"), Id("D")}));
}

void TestFailedChildBecomesLeaf() {
  Fixture f;
  f.Diamond();
  f.gateway->AddModel(Id("X"), "X");
  f.gateway->AddLink(Id("A"), Id("X"));
  f.gateway->InjectFault(Id("A"), Operation::kOpenDetached, ErrorKind::kAccessDenied);
  f.gateway->AddLink(Id("B"), Id("missing"));

  const auto result = f.discoverer->Discover(Id("R"), "R");
  const auto& a     = result.graph.Node(Id("A"));
  assert(a.state == DiscoveryState::kFailed);
  assert(a.error == ErrorKind::kAccessDenied);
  assert(a.children.empty());

  // X is only reachable through A.
  assert(!result.graph.Contains(Id("X")));

  const auto& missing = result.graph.Node(Id("missing"));
  assert(missing.state == DiscoveryState::kFailed);
  assert(missing.error == ErrorKind::kNotFound);

  assert(result.graph.Node(Id("C")).state == DiscoveryState::kDiscovered);
  assert(result.graph.Complete());
  assert(f.gateway->OpenHandles() == 0);
}

void TestTransientOpenIsRetried() {
  Fixture f(2, 2);
  f.Diamond();
  f.gateway->InjectFault(Id("C"), Operation::kOpenDetached, ErrorKind::kTransientIO, 1);

  const auto result = f.discoverer->Discover(Id("R"), "R");
  assert(result.graph.Node(Id("C")).state == DiscoveryState::kDiscovered);
  assert(f.gateway->CallCount(Id("C"), Operation::kOpenDetached) == 2);

  Fixture g(2, 0);
  g.Diamond();
  g.gateway->InjectFault(Id("C"), Operation::kOpenDetached, ErrorKind::kTransientIO, 1);
  const auto no_retry = g.discoverer->Discover(Id("R"), "R");
  assert(no_retry.graph.Node(Id("C")).state == DiscoveryState::kFailed);
  assert(no_retry.graph.Node(Id("C")).error == ErrorKind::kTransientIO);
}

void TestCallerRootHandleIsNotClosed() {
  Fixture f;
  f.Diamond();

  const auto root_handle = f.gateway->OpenFull(Id("R"));
  const auto result      = f.discoverer->Discover(Id("R"), "R", root_handle);

  assert(result.graph.Size() == 4);
  assert(f.gateway->OpenCount(Id("R"), OpenMode::kDetached) == 0);
  assert(f.gateway->OpenHandles() == 1);

  f.gateway->Close(root_handle);
  assert(f.gateway->OpenHandles() == 0);
}

void TestOutageAbortsAndDrains() {
  Fixture f;
  f.Diamond();
  f.gateway->InjectFault(Id("B"), Operation::kReadLinks, ErrorKind::kGatewayUnavailable);

  bool threw = false;
  try {
    (void)f.discoverer->Discover(Id("R"), "R");
  } catch (const linksync::util::GatewayUnavailable&) {
    threw = true;
  }
  assert(threw);
  assert(f.ledger->OpenCount() == 0);
  assert(f.gateway->OpenHandles() == 0);

  Fixture down;
  down.Diamond();
  down.gateway->SetUnavailable(true);
  threw = false;
  try {
    (void)down.discoverer->Discover(Id("R"), "R");
  } catch (const linksync::util::GatewayUnavailable&) {
    threw = true;
  }
  assert(threw);
  assert(down.gateway->TotalOpens() == 0);
}

void TestCancelledDiscoveryIsMarked() {
  Fixture f;
  f.Diamond();

  linksync::util::CancellationToken cancel;
  cancel.Cancel();

  const auto result = f.discoverer->Discover(Id("R"), "R", std::nullopt, &cancel);
  assert(result.cancelled);
  assert(!result.graph.Complete());
  assert(f.gateway->TotalOpens() == 0);
}

void TestSkippedLinksAreRecorded() {
  Fixture f;
  f.Diamond();
  f.gateway->AddUnresolvedLink(Id("A"), "C:/local/site.rvt");

  const auto result = f.discoverer->Discover(Id("R"), "R");
  const auto& a     = result.graph.Node(Id("A"));
  assert(a.skipped_links.size() == 1);
  assert(a.skipped_links[0] == "C:/local/site.rvt");

  bool reported = false;
  for (const auto& event : f.events->History()) {
    if (event.identity == Id("A") && event.detail == "Skipped link: C:/local/site.rvt") reported = true;
  }
  assert(reported);
}

} // namespace

int main() {
  TestSharedChildIsOpenedOnce();
  TestOrderDoesNotDependOnConcurrency();
  TestFailedChildBecomesLeaf();
  TestTransientOpenIsRetried();
  TestCallerRootHandleIsNotClosed();
  TestOutageAbortsAndDrains();
  TestCancelledDiscoveryIsMarked();
  TestSkippedLinksAreRecorded();

  std::cout << "linksync_unit_dependency_discoverer: pass\n";
  return 0;
}
