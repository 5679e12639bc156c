#include "internal/ledger/resource_ledger.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/gateway/memory/memory_gateway.hpp"

namespace {

using linksync::gateway::OpenMode;
using linksync::gateway::memory::MemoryGateway;
using linksync::ledger::ResourceLedger;
using linksync::ledger::ScopedDocument;
using linksync::model::ModelIdentity;
using linksync::model::Region;

std::shared_ptr<MemoryGateway> MakeGateway() {
  auto gateway = std::make_shared<MemoryGateway>();
  gateway->AddModel(ModelIdentity(Region::kUS, "p", "a"), "A");
  gateway->AddModel(ModelIdentity(Region::kUS, "p", "b"), "B");
  return gateway;
}

void TestReleaseClosesExactlyOnce() {
  auto           gateway = MakeGateway();
  ResourceLedger ledger(gateway);

  const auto handle = gateway->OpenFull(ModelIdentity(Region::kUS, "p", "a"));
  ledger.Register(handle);
  assert(ledger.OpenCount() == 1);
  assert(ledger.HoldsModel(handle.identity));

  assert(ledger.Release(handle.id));
  assert(!ledger.Release(handle.id));
  assert(ledger.OpenCount() == 0);
  assert(!ledger.HoldsModel(handle.identity));

  assert(gateway->TotalCloses() == 1);
  assert(gateway->RedundantCloses() == 0);
  assert(gateway->OpenHandles() == 0);
}

void TestRegisterIsIdempotent() {
  auto           gateway = MakeGateway();
  ResourceLedger ledger(gateway);

  const auto handle = gateway->OpenDetached(ModelIdentity(Region::kUS, "p", "a"));
  ledger.Register(handle);
  ledger.Register(handle);
  assert(ledger.OpenCount() == 1);
  assert(ledger.TotalRegistered() == 1);

  ledger.Release(handle.id);
}

void TestDrainClosesEverythingStillOpen() {
  auto           gateway = MakeGateway();
  ResourceLedger ledger(gateway);

  ledger.Register(gateway->OpenFull(ModelIdentity(Region::kUS, "p", "a")));
  ledger.Register(gateway->OpenDetached(ModelIdentity(Region::kUS, "p", "b")));
  ledger.Register(gateway->OpenDetached(ModelIdentity(Region::kUS, "p", "b")));

  assert(ledger.Drain() == 3);
  assert(ledger.OpenCount() == 0);
  assert(ledger.Drain() == 0);
  assert(gateway->OpenHandles() == 0);
  assert(gateway->TotalCloses() == 3);
  assert(ledger.TotalReleased() == ledger.TotalRegistered());
}

void TestScopedDocumentReleasesOnException() {
  auto           gateway = MakeGateway();
  ResourceLedger ledger(gateway);

  try {
    ScopedDocument document(ledger, gateway->OpenDetached(ModelIdentity(Region::kUS, "p", "a")));
    assert(ledger.Holds(document.handle().id));
    assert(document.handle().mode == OpenMode::kDetached);
    throw std::runtime_error("inspection failed");
  } catch (const std::runtime_error&) {
  }

  assert(ledger.OpenCount() == 0);
  assert(gateway->OpenHandles() == 0);
}

void TestDestructorDrainsLeftovers() {
  auto gateway = MakeGateway();
  {
    ResourceLedger ledger(gateway);
    ledger.Register(gateway->OpenFull(ModelIdentity(Region::kUS, "p", "a")));
  }
  assert(gateway->OpenHandles() == 0);
}

} // namespace

int main() {
  TestReleaseClosesExactlyOnce();
  TestRegisterIsIdempotent();
  TestDrainClosesEverythingStillOpen();
  TestScopedDocumentReleasesOnException();
  TestDestructorDrainsLeftovers();

  std::cout << "linksync_unit_resource_ledger: pass\n";
  return 0;
}
