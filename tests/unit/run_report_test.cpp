#include "internal/report/run_report.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using linksync::graph::DependencyGraph;
using linksync::model::ErrorKind;
using linksync::model::ModelIdentity;
using linksync::model::Region;
using linksync::model::SkipReason;
using linksync::model::SyncTask;
using linksync::model::TaskState;
using linksync::sync::RunResult;
using linksync::sync::RunStatus;

ModelIdentity Id(const std::string& model) {
  return ModelIdentity(Region::kEMEA, "proj", model);
}

bool Contains(const std::string& text, const std::string& needle) {
  return text.find(needle) != std::string::npos;
}

SyncTask Task(const std::string& name, TaskState state, bool implicit) {
  SyncTask task(Id(name));
  task.name     = name;
  task.state    = state;
  task.implicit = implicit;
  task.attempt  = state == TaskState::kSkipped ? 0 : 1;
  return task;
}

// C failed to open (locked), A was skipped because of it, R synced.
RunResult FailedRun() {
  RunResult result;
  result.status      = RunStatus::kCompleted;
  result.started_at  = linksync::util::Now();
  result.finished_at = result.started_at;

  auto c               = Task("Structure", TaskState::kFailed, true);
  c.identity           = Id("c");
  c.last_error         = ErrorKind::kLocked;
  c.last_error_message = "held by another session";
  c.attempt            = 3;

  auto a        = Task("Interior", TaskState::kSkipped, false);
  a.identity    = Id("a");
  a.skip_reason = SkipReason::kDependencyFailed;
  a.blocked_by  = Id("c");
  a.last_error  = ErrorKind::kLocked;

  auto b     = Task("Site", TaskState::kSynced, false);
  b.identity = Id("b");

  result.tasks = {c, a, b};
  return result;
}

void TestSyncSummaryExplainsSkips() {
  const auto text = linksync::report::FormatSyncSummary(FailedRun());

  assert(Contains(text, "Selected models"));
  assert(Contains(text, "Included dependencies"));
  assert(Contains(text, "Failed  Structure (EMEA/proj/c)  error=Locked (held by another session)"));
  assert(Contains(text, "attempts=3"));
  assert(Contains(text, "Skipped  Interior (EMEA/proj/a)"));
  assert(Contains(text, "reason=dependency failed"));
  assert(Contains(text, "blocked_by=Structure"));
  assert(Contains(text, "Synced  Site (EMEA/proj/b)"));
  assert(Contains(text, "Run Completed: 1 synced, 1 failed, 1 skipped"));

  // selected models are listed before their dependencies
  assert(text.find("Selected models") < text.find("Included dependencies"));
}

void TestSyncReportCounts() {
  const auto report = linksync::report::BuildSyncReport(FailedRun());

  assert(report.status() == linksync::v1::RUN_STATUS_COMPLETED);
  assert(report.synced() == 1);
  assert(report.failed() == 1);
  assert(report.skipped() == 1);
  assert(report.explicit_tasks_size() == 2);
  assert(report.implicit_tasks_size() == 1);

  const auto& failed = report.implicit_tasks(0);
  assert(failed.state() == linksync::v1::TASK_STATE_FAILED);
  assert(failed.error() == linksync::v1::ERROR_KIND_LOCKED);
  assert(failed.attempts() == 3);

  const auto& skipped = report.explicit_tasks(0);
  assert(skipped.blocked_by().model_id() == "c");
  assert(skipped.blocked_by().name() == "Structure");
  assert(skipped.blocked_by().region() == "EMEA");

  const auto json = linksync::report::ToJson(report);
  assert(Contains(json, "\"explicit_tasks\""));
  assert(Contains(json, "\"RUN_STATUS_COMPLETED\""));
  assert(Contains(json, "\"blocked_by\""));
}

DependencyGraph CyclicGraph() {
  // R -> A -> B -> A
  DependencyGraph graph(Id("r"), "Root");
  graph.Insert(Id("a"), "Alpha");
  graph.MarkDiscovering(Id("r"));
  graph.RecordLinks(Id("r"), {Id("a")}, {"C:/local/site.rvt"});
  graph.MarkDiscovered(Id("r"));

  graph.Insert(Id("b"), "Beta");
  graph.MarkDiscovering(Id("a"));
  graph.RecordLinks(Id("a"), {Id("b")}, {});
  graph.MarkDiscovered(Id("a"));

  graph.MarkDiscovering(Id("b"));
  graph.RecordLinks(Id("b"), {Id("a")}, {});
  graph.MarkDiscovered(Id("b"));
  return graph;
}

void TestDiscoveryReportCarriesCycle() {
  const auto graph = CyclicGraph();
  const std::vector<ModelIdentity> cycle = {Id("a"), Id("b")};

  const auto report = linksync::report::BuildDiscoveryReport(graph, false, {}, cycle);
  assert(report.root().model_id() == "r");
  assert(report.models_size() == 3);
  assert(report.order_size() == 0);
  assert(report.cycle_size() == 2);
  assert(report.cycle(0).name() == "Alpha");
  assert(!report.cancelled());

  const auto text = linksync::report::FormatDiscoverySummary(graph, {}, cycle);
  assert(Contains(text, "Linked models (3)"));
  assert(Contains(text, "[circular]"));
  assert(Contains(text, "! skipped link: C:/local/site.rvt"));
  assert(Contains(text, "Circular links: Alpha -> Beta -> Alpha"));
  assert(!Contains(text, "Sync order"));
}

void TestDiscoverySummaryListsOrder() {
  DependencyGraph graph(Id("r"), "Root");
  graph.Insert(Id("a"), "Alpha");
  graph.MarkDiscovering(Id("r"));
  graph.RecordLinks(Id("r"), {Id("a")}, {});
  graph.MarkDiscovered(Id("r"));
  graph.MarkDiscovering(Id("a"));
  graph.MarkFailed(Id("a"), ErrorKind::kNotFound, "gone");

  const std::vector<ModelIdentity> order = {Id("a"), Id("r")};
  const auto text = linksync::report::FormatDiscoverySummary(graph, order, {});
  assert(Contains(text, "[Failed: NotFound]"));
  assert(Contains(text, "Sync order (leaf first)"));
  assert(Contains(text, "1. Alpha"));
  assert(Contains(text, "2. Root"));

  const auto report = linksync::report::BuildDiscoveryReport(graph, false, order, {});
  assert(report.models(1).state() == linksync::v1::DISCOVERY_STATE_FAILED);
  assert(report.models(1).error() == linksync::v1::ERROR_KIND_NOT_FOUND);
}

} // namespace

int main() {
  TestSyncSummaryExplainsSkips();
  TestSyncReportCounts();
  TestDiscoveryReportCarriesCycle();
  TestDiscoverySummaryListsOrder();

  std::cout << "linksync_unit_run_report: pass\n";
  return 0;
}
