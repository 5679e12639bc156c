#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/events/event_channel.hpp"
#include "internal/gateway/cloud_document_gateway.hpp"
#include "internal/ledger/resource_ledger.hpp"
#include "internal/model/sync_task.hpp"
#include "internal/planning/sync_plan.hpp"
#include "internal/sync/run_options.hpp"
#include "internal/sync/sync_job.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/time.hpp"

namespace linksync::sync {

enum class RunStatus : std::uint8_t {
  kCompleted,
  kCancelled,
  kAborted,
};

std::string_view ToString(RunStatus status);

struct RunResult {
  RunStatus   status{RunStatus::kCompleted};
  std::string abort_reason;

  // Plan order, leaf first.
  std::vector<model::SyncTask> tasks;

  util::TimePoint started_at{};
  util::TimePoint finished_at{};

  std::vector<events::Event> transitions;

  std::vector<model::SyncTask> ExplicitTasks() const;
  std::vector<model::SyncTask> ImplicitTasks() const;

  std::size_t Count(model::TaskState state) const;

  // Completed with every task Synced.
  bool Clean() const;
};

/*
  Runs a sync plan bottom-up against the gateway.

  A single scheduling loop on the calling thread moves tasks out of
  WaitingOnChildren once every plan child is Synced, and hands them to a
  pool of max_concurrent_syncs workers. Each task is opened in full mode,
  has run options applied, waits out the link reload pause, syncs and is
  closed. The reload pause and retry backoffs are delayed scheduler
  entries: the task keeps its slot and its open handle, not a thread.

  Failures stay local to the task and skip its ancestors. Cancellation
  stops dispatching and lets in-flight tasks finish. GatewayUnavailable
  halts the run; every handle is released before Run() returns.
*/
class SyncOrchestrator {
 public:
  SyncOrchestrator(gateway::CloudDocumentGatewayPtr gateway, std::shared_ptr<ledger::ResourceLedger> ledger,
                   std::shared_ptr<events::EventChannel> events);

  RunResult Run(const planning::SyncPlan& plan, const RunOptions& options, const util::CancellationToken* cancel = nullptr);

 private:
  struct RunState;

  void Execute(RunState& run, const SyncJob& job);
  void StepOpen(RunState& run, std::size_t index);
  void StepSync(RunState& run, std::size_t index);
  void HandleFailure(RunState& run, std::size_t index, SyncStep step, const std::exception& error);

  void ReleaseHandle(RunState& run, std::size_t index);
  void Fail(RunState& run, std::size_t index, model::ErrorKind kind, const std::string& message);
  void Finish(RunState& run, std::size_t index);
  void Halt(RunState& run, const std::string& reason);

  void PropagateSkips(RunState& run);
  void Dispatch(RunState& run);
  void SkipWaiting(RunState& run, model::SkipReason reason);

  gateway::CloudDocumentGatewayPtr        gateway_;
  std::shared_ptr<ledger::ResourceLedger> ledger_;
  std::shared_ptr<events::EventChannel>   events_;
};

} // namespace linksync::sync
