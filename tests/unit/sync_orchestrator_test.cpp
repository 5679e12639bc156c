#include "internal/sync/sync_orchestrator.hpp"

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/discovery/dependency_discoverer.hpp"
#include "internal/gateway/memory/memory_gateway.hpp"
#include "internal/planning/sync_plan.hpp"
#include "internal/planning/topological_sorter.hpp"

namespace {

using linksync::events::EventChannel;
using linksync::events::EventType;
using linksync::gateway::OpenMode;
using linksync::gateway::memory::MemoryGateway;
using linksync::gateway::memory::Operation;
using linksync::ledger::ResourceLedger;
using linksync::model::ErrorKind;
using linksync::model::ModelIdentity;
using linksync::model::Region;
using linksync::model::SkipReason;
using linksync::model::SyncTask;
using linksync::model::TaskState;
using linksync::planning::SyncPlan;
using linksync::sync::RunOptions;
using linksync::sync::RunResult;
using linksync::sync::RunStatus;
using linksync::sync::SyncOrchestrator;

ModelIdentity Id(const std::string& model) {
  return ModelIdentity(Region::kUS, "proj", model);
}

RunOptions FastOptions() {
  RunOptions options;
  options.link_reload_delay    = std::chrono::milliseconds(0);
  options.max_concurrent_syncs = 2;
  return options;
}

struct Fixture {
  Fixture() {
    gateway      = std::make_shared<MemoryGateway>();
    ledger       = std::make_shared<ResourceLedger>(gateway);
    events       = std::make_shared<EventChannel>();
    orchestrator = std::make_unique<SyncOrchestrator>(gateway, ledger, events);
  }

  void Models(const std::vector<std::string>& names) {
    for (const auto& name : names) gateway->AddModel(Id(name), name);
  }

  void Link(const std::string& parent, const std::string& child) {
    gateway->AddLink(Id(parent), Id(child));
  }

  SyncPlan Plan(const std::string& root, const std::vector<std::string>& selection = {}) {
    linksync::discovery::DependencyDiscoverer discoverer(gateway, ledger, events, linksync::discovery::DiscoveryOptions{});
    const auto discovered = discoverer.Discover(Id(root), root);
    const auto order      = linksync::planning::TopologicalSorter::Sort(discovered.graph);

    std::vector<ModelIdentity> selected;
    for (const auto& name : selection) selected.push_back(Id(name));
    if (selected.empty()) selected.push_back(Id(root));
    return linksync::planning::BuildPlan(discovered.graph, order, selected);
  }

  std::shared_ptr<MemoryGateway>     gateway;
  std::shared_ptr<ResourceLedger>    ledger;
  std::shared_ptr<EventChannel>      events;
  std::unique_ptr<SyncOrchestrator> orchestrator;
};

const SyncTask& Task(const RunResult& result, const std::string& name) {
  for (const auto& task : result.tasks) {
    if (task.identity == Id(name)) return task;
  }
  assert(false && "task not in result");
  return result.tasks.front();
}

// Polls until the condition holds or a second passes.
bool WaitFor(const std::function<bool()>& condition) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return condition();
}

void AssertNoLeaks(const Fixture& f) {
  assert(f.ledger->OpenCount() == 0);
  assert(f.gateway->OpenHandles() == 0);
  assert(f.gateway->RedundantCloses() == 0);
}

void TestDiamondSyncsChildrenFirst() {
  Fixture f;
  f.Models({"R", "A", "B", "C"});
  f.Link("R", "A");
  f.Link("R", "B");
  f.Link("A", "C");
  f.Link("B", "C");

  const auto plan   = f.Plan("R");
  const auto result = f.orchestrator->Run(plan, FastOptions());

  assert(result.status == RunStatus::kCompleted);
  assert(result.Clean());
  assert(result.ExplicitTasks().size() == 1);
  assert(result.ImplicitTasks().size() == 3);
  assert(f.gateway->SyncCount(Id("C")) == 1);
  assert(f.gateway->OpenCount(Id("C"), OpenMode::kFull) == 1);

  const std::vector<std::pair<std::string, std::string>> edges = {{"R", "A"}, {"R", "B"}, {"A", "C"}, {"B", "C"}};
  for (const auto& [parent, child] : edges) {
    assert(*Task(result, parent).opened_at >= *Task(result, child).finished_at);
  }

  const auto log = f.gateway->SyncLog();
  assert(log.size() == 4);
  assert(log.front().identity == Id("C"));
  assert(log.back().identity == Id("R"));

  // Queued -> Waiting -> Opening -> Syncing -> Closing -> Synced per task
  assert(result.transitions.size() == 4 * 5);
  AssertNoLeaks(f);

  const auto history = f.events->History();
  assert(history.back().type == EventType::kRunFinished);
}

void TestLockedChildSkipsOnlyItsAncestors() {
  Fixture f;
  f.Models({"R", "A", "B", "C", "D"});
  f.Link("R", "A");
  f.Link("R", "B");
  f.Link("A", "C");
  f.Link("B", "D");
  f.gateway->InjectFault(Id("C"), Operation::kOpenFull, ErrorKind::kLocked);

  auto options                     = FastOptions();
  options.retry.max_retry_attempts = 2;

  const auto result = f.orchestrator->Run(f.Plan("R"), options);
  assert(result.status == RunStatus::kCompleted);
  assert(!result.Clean());

  const auto& c = Task(result, "C");
  assert(c.state == TaskState::kFailed);
  assert(c.last_error == ErrorKind::kLocked);
  assert(c.attempt == 3);
  assert(f.gateway->CallCount(Id("C"), Operation::kOpenFull) == 3);

  const auto& a = Task(result, "A");
  assert(a.state == TaskState::kSkipped);
  assert(a.skip_reason == SkipReason::kDependencyFailed);
  assert(a.blocked_by == Id("C"));
  assert(!a.opened_at);

  assert(Task(result, "B").state == TaskState::kSynced);
  assert(Task(result, "D").state == TaskState::kSynced);

  const auto& r = Task(result, "R");
  assert(r.state == TaskState::kSkipped);
  assert(r.blocked_by == Id("C"));
  assert(f.gateway->OpenCount(Id("R"), OpenMode::kFull) == 0);

  AssertNoLeaks(f);
}

void TestTransientSyncIsRetried() {
  Fixture f;
  f.Models({"R", "C"});
  f.Link("R", "C");
  f.gateway->InjectFault(Id("C"), Operation::kSync, ErrorKind::kTransientIO, 1);

  auto options                     = FastOptions();
  options.retry.max_retry_attempts = 1;

  const auto result = f.orchestrator->Run(f.Plan("R"), options);
  assert(result.Clean());

  const auto& c = Task(result, "C");
  assert(c.attempt == 2);
  assert(f.gateway->CallCount(Id("C"), Operation::kSync) == 2);
  assert(f.gateway->SyncCount(Id("C")) == 1);
  // the document stays open between sync attempts
  assert(f.gateway->OpenCount(Id("C"), OpenMode::kFull) == 1);
  AssertNoLeaks(f);
}

void TestSyncConflictIsNotRetried() {
  Fixture f;
  f.Models({"R"});
  f.gateway->InjectFault(Id("R"), Operation::kSync, ErrorKind::kSyncConflict);

  auto options                     = FastOptions();
  options.retry.max_retry_attempts = 3;

  const auto result = f.orchestrator->Run(f.Plan("R"), options);
  const auto& r     = Task(result, "R");
  assert(r.state == TaskState::kFailed);
  assert(r.last_error == ErrorKind::kSyncConflict);
  assert(f.gateway->CallCount(Id("R"), Operation::kSync) == 1);
  AssertNoLeaks(f);
}

void TestDiscoveryFailureFailsWithoutOpening() {
  Fixture f;
  f.Models({"R", "A", "B", "C"});
  f.Link("R", "A");
  f.Link("R", "B");
  f.Link("A", "C");
  f.Link("B", "missing");

  const auto result = f.orchestrator->Run(f.Plan("R"), FastOptions());

  const auto& missing = Task(result, "missing");
  assert(missing.state == TaskState::kFailed);
  assert(missing.last_error == ErrorKind::kNotFound);
  assert(f.gateway->OpenCount(Id("missing"), OpenMode::kFull) == 0);

  assert(Task(result, "B").blocked_by == Id("missing"));
  assert(Task(result, "R").blocked_by == Id("missing"));
  assert(Task(result, "A").state == TaskState::kSynced);
  assert(Task(result, "C").state == TaskState::kSynced);
  AssertNoLeaks(f);
}

void TestCancelBeforeStartSkipsEverything() {
  Fixture f;
  f.Models({"R", "A"});
  f.Link("R", "A");

  linksync::util::CancellationToken cancel;
  cancel.Cancel();

  const auto result = f.orchestrator->Run(f.Plan("R"), FastOptions(), &cancel);
  assert(result.status == RunStatus::kCancelled);
  for (const auto& task : result.tasks) {
    assert(task.state == TaskState::kSkipped);
    assert(task.skip_reason == SkipReason::kCancelled);
  }
  assert(f.gateway->TotalOpens() == 1 + 1);  // discovery only
  assert(f.gateway->OpenCount(Id("A"), OpenMode::kFull) == 0);
  AssertNoLeaks(f);
}

void TestOutageAbortsTheRun() {
  Fixture f;
  f.Models({"R", "A", "B", "C"});
  f.Link("R", "A");
  f.Link("R", "B");
  f.Link("A", "C");
  f.Link("B", "C");
  const auto plan = f.Plan("R");

  f.gateway->InjectFault(Id("C"), Operation::kSync, ErrorKind::kGatewayUnavailable);

  auto options                     = FastOptions();
  options.retry.max_retry_attempts = 3;

  const auto result = f.orchestrator->Run(plan, options);
  assert(result.status == RunStatus::kAborted);
  assert(!result.abort_reason.empty());

  const auto& c = Task(result, "C");
  assert(c.state == TaskState::kFailed);
  assert(c.last_error == ErrorKind::kGatewayUnavailable);
  assert(f.gateway->CallCount(Id("C"), Operation::kSync) == 1);

  for (const auto* name : {"A", "B", "R"}) {
    const auto& task = Task(result, name);
    assert(task.state == TaskState::kSkipped);
    assert(task.skip_reason == SkipReason::kGatewayUnavailable);
  }
  AssertNoLeaks(f);
}

void TestOutageDuringReloadPauseEndsRunPromptly() {
  for (int round = 0; round < 5; ++round) {
    Fixture f;
    f.Models({"R", "A", "B"});
    f.Link("R", "A");
    f.Link("R", "B");
    const auto plan = f.Plan("R");

    f.gateway->SetLatency(std::chrono::milliseconds(50));
    f.gateway->InjectFault(Id("B"), Operation::kOpenFull, ErrorKind::kGatewayUnavailable);

    auto options              = FastOptions();
    options.link_reload_delay = std::chrono::milliseconds(5000);

    const auto started = std::chrono::steady_clock::now();
    const auto result  = f.orchestrator->Run(plan, options);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    assert(elapsed < std::chrono::milliseconds(2500));
    assert(result.status == RunStatus::kAborted);
    assert(Task(result, "A").state == TaskState::kFailed);
    assert(Task(result, "A").last_error == ErrorKind::kGatewayUnavailable);
    assert(Task(result, "R").skip_reason == SkipReason::kGatewayUnavailable);
    AssertNoLeaks(f);
  }
}

void TestOutageClosesSiblingHandle() {
  Fixture f;
  f.Models({"R", "A", "B"});
  f.Link("R", "A");
  f.Link("R", "B");
  const auto plan = f.Plan("R");

  // B keeps retrying a lock while A sits in its reload pause holding a full open
  f.gateway->InjectFault(Id("B"), Operation::kOpenFull, ErrorKind::kLocked);

  auto options                     = FastOptions();
  options.link_reload_delay        = std::chrono::milliseconds(5000);
  options.retry.max_retry_attempts = 50;
  options.retry.backoff_base       = std::chrono::milliseconds(20);
  options.retry.max_backoff        = std::chrono::milliseconds(20);

  RunResult   result;
  const auto  started = std::chrono::steady_clock::now();
  std::thread runner([&] { result = f.orchestrator->Run(plan, options); });

  assert(WaitFor([&] { return f.ledger->HoldsModel(Id("A")); }));
  f.gateway->SetUnavailable(true);
  runner.join();

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  assert(elapsed < std::chrono::milliseconds(2500));
  assert(result.status == RunStatus::kAborted);

  const auto& a = Task(result, "A");
  assert(a.state == TaskState::kFailed);
  assert(a.last_error == ErrorKind::kGatewayUnavailable);
  assert(f.gateway->OpenCount(Id("A"), OpenMode::kFull) == 1);
  assert(f.gateway->SyncCount(Id("A")) == 0);

  assert(Task(result, "B").last_error == ErrorKind::kGatewayUnavailable);
  assert(Task(result, "R").state == TaskState::kSkipped);
  AssertNoLeaks(f);
}

void TestCancelMidRunLetsInFlightTaskFinish() {
  Fixture f;
  f.Models({"R", "A"});
  f.Link("R", "A");
  const auto plan = f.Plan("R");

  auto options              = FastOptions();
  options.link_reload_delay = std::chrono::milliseconds(300);

  linksync::util::CancellationToken cancel;
  RunResult                         result;
  std::thread                       runner([&] { result = f.orchestrator->Run(plan, options, &cancel); });

  assert(WaitFor([&] { return f.ledger->HoldsModel(Id("A")); }));
  cancel.Cancel();
  runner.join();

  assert(result.status == RunStatus::kCancelled);
  assert(Task(result, "A").state == TaskState::kSynced);
  assert(f.gateway->SyncCount(Id("A")) == 1);

  const auto& r = Task(result, "R");
  assert(r.state == TaskState::kSkipped);
  assert(r.skip_reason == SkipReason::kCancelled);
  assert(f.gateway->OpenCount(Id("R"), OpenMode::kFull) == 0);
  AssertNoLeaks(f);
}

void TestConcurrencyLimitBoundsFullOpens() {
  Fixture f;
  std::vector<std::string> names = {"R"};
  for (int i = 0; i < 8; ++i) {
    const auto name = "L" + std::to_string(i);
    names.push_back(name);
  }
  f.Models(names);
  for (std::size_t i = 1; i < names.size(); ++i) f.Link("R", names[i]);
  const auto plan = f.Plan("R");

  f.gateway->SetLatency(std::chrono::milliseconds(5));

  auto options                 = FastOptions();
  options.max_concurrent_syncs = 3;

  const auto result = f.orchestrator->Run(plan, options);
  assert(result.Clean());
  assert(f.gateway->PeakOpenHandles(OpenMode::kFull) <= 3);
  assert(f.gateway->PeakOpenHandles(OpenMode::kFull) >= 1);
  AssertNoLeaks(f);
}

void TestLinkReloadPauseOnlyWithReloadLinks() {
  {
    Fixture f;
    f.Models({"R"});
    auto options              = FastOptions();
    options.link_reload_delay = std::chrono::milliseconds(100);

    const auto result = f.orchestrator->Run(f.Plan("R"), options);
    const auto& r     = Task(result, "R");
    assert(r.state == TaskState::kSynced);
    assert(linksync::util::MillisBetween(*r.opened_at, *r.finished_at) >= 100);
  }
  {
    Fixture f;
    f.Models({"R"});
    auto options                  = FastOptions();
    options.link_reload_delay     = std::chrono::milliseconds(5000);
    options.document.reload_links = false;

    const auto result = f.orchestrator->Run(f.Plan("R"), options);
    const auto& r     = Task(result, "R");
    assert(r.state == TaskState::kSynced);
    assert(linksync::util::MillisBetween(*r.opened_at, *r.finished_at) < 5000);
  }
}

void TestEmptyPlanCompletes() {
  Fixture f;
  const auto result = f.orchestrator->Run(SyncPlan{}, FastOptions());
  assert(result.status == RunStatus::kCompleted);
  assert(result.tasks.empty());
  assert(result.Clean());
}

} // namespace

int main() {
  TestDiamondSyncsChildrenFirst();
  TestLockedChildSkipsOnlyItsAncestors();
  TestTransientSyncIsRetried();
  TestSyncConflictIsNotRetried();
  TestDiscoveryFailureFailsWithoutOpening();
  TestCancelBeforeStartSkipsEverything();
  TestOutageAbortsTheRun();
  TestOutageDuringReloadPauseEndsRunPromptly();
  TestOutageClosesSiblingHandle();
  TestCancelMidRunLetsInFlightTaskFinish();
  TestConcurrencyLimitBoundsFullOpens();
  TestLinkReloadPauseOnlyWithReloadLinks();
  TestEmptyPlanCompletes();

  std::cout << "linksync_unit_sync_orchestrator: pass\n";
  return 0;
}
