#include "internal/sync/sync_orchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <iterator>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/sync/sync_scheduler.hpp"
#include "internal/sync/sync_worker.hpp"
#include "internal/sync/task_board.hpp"
#include "internal/util/errors.hpp"

namespace linksync::sync {

namespace obs = linksync::observability;

using model::ErrorKind;
using model::SkipReason;
using model::TaskState;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(25);

} // namespace

std::string_view ToString(RunStatus status) {
  switch (status) {
    case RunStatus::kCompleted:
      return "Completed";
    case RunStatus::kCancelled:
      return "Cancelled";
    case RunStatus::kAborted:
      return "Aborted";
  }
  return "Unknown";
}

std::vector<model::SyncTask> RunResult::ExplicitTasks() const {
  std::vector<model::SyncTask> out;
  std::copy_if(tasks.begin(), tasks.end(), std::back_inserter(out), [](const model::SyncTask& t) { return !t.implicit; });
  return out;
}

std::vector<model::SyncTask> RunResult::ImplicitTasks() const {
  std::vector<model::SyncTask> out;
  std::copy_if(tasks.begin(), tasks.end(), std::back_inserter(out), [](const model::SyncTask& t) { return t.implicit; });
  return out;
}

std::size_t RunResult::Count(TaskState state) const {
  return static_cast<std::size_t>(std::count_if(tasks.begin(), tasks.end(), [state](const model::SyncTask& t) { return t.state == state; }));
}

bool RunResult::Clean() const {
  return status == RunStatus::kCompleted && Count(TaskState::kSynced) == tasks.size();
}

// ------------------------------------------------------------
// Per-run state
// ------------------------------------------------------------

struct SyncOrchestrator::RunState {
  // Owned by whichever worker runs the task's current job.
  struct TaskRuntime {
    std::optional<gateway::DocumentHandle> handle;
    std::uint32_t                          step_attempts{0};
  };

  RunState(const planning::SyncPlan& p, const RunOptions& o, std::shared_ptr<events::EventChannel> events)
      : plan(p), options(o), board(p, std::move(events)), scheduler(std::make_shared<SyncScheduler>()), runtime(p.entries.size()) {
    children.resize(plan.entries.size());
    for (std::size_t i = 0; i < plan.entries.size(); ++i) {
      for (const auto& child : plan.entries[i].children) {
        if (auto child_index = board.IndexOf(child)) {
          children[i].push_back(*child_index);
        }
      }
    }
  }

  const planning::SyncPlan& plan;
  const RunOptions&         options;

  TaskBoard                             board;
  std::shared_ptr<SyncScheduler>        scheduler;
  std::vector<TaskRuntime>              runtime;
  std::vector<std::vector<std::size_t>> children;

  std::mutex              mutex;
  std::condition_variable cv;
  std::size_t             in_flight{0};
  std::uint64_t           completions{0};
  std::atomic<bool>       halted{false};
  std::string             abort_reason;
};

SyncOrchestrator::SyncOrchestrator(gateway::CloudDocumentGatewayPtr gateway, std::shared_ptr<ledger::ResourceLedger> ledger,
                                   std::shared_ptr<events::EventChannel> events)
    : gateway_(std::move(gateway)), ledger_(std::move(ledger)), events_(std::move(events)) {
}

// ------------------------------------------------------------
// Worker side
// ------------------------------------------------------------

void SyncOrchestrator::Execute(RunState& run, const SyncJob& job) {
  const auto& entry = run.plan.entries[job.task_index];

  obs::SpanScope span("linksync.sync_task");
  span.SetAttribute("linksync.model", entry.identity.ToString());
  span.SetAttribute("linksync.step", ToString(job.step));

  if (run.halted.load()) {
    ReleaseHandle(run, job.task_index);
    Fail(run, job.task_index, ErrorKind::kGatewayUnavailable, "run halted: gateway unavailable");
    return;
  }

  try {
    if (job.step == SyncStep::kOpen) {
      StepOpen(run, job.task_index);
    } else {
      StepSync(run, job.task_index);
    }
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    LINKSYNC_LOG_ERROR("Unexpected error in sync task", {obs::StringField("model", entry.identity.ToString()), obs::StringField("error", e.what())});
    ReleaseHandle(run, job.task_index);
    Fail(run, job.task_index, ErrorKind::kInternal, e.what());
  }
}

void SyncOrchestrator::StepOpen(RunState& run, std::size_t index) {
  auto&       rt = run.runtime[index];
  const auto& id = run.plan.entries[index].identity;

  ++rt.step_attempts;
  run.board.Update(index, [](model::SyncTask& task) { ++task.attempt; });

  try {
    auto handle = gateway_->OpenFull(id);
    obs::Metrics::Instance().RecordModelOpen("full", true);
    ledger_->Register(handle);
    rt.handle = std::move(handle);

    const auto outcome = gateway_->ApplyOptions(*rt.handle, run.options.document);
    run.board.Update(index, [&outcome](model::SyncTask& task) { task.applied = outcome; });
  } catch (const std::exception& e) {
    if (!rt.handle) {
      obs::Metrics::Instance().RecordModelOpen("full", false);
    }
    HandleFailure(run, index, SyncStep::kOpen, e);
    return;
  }

  rt.step_attempts = 0;

  const auto delay = run.options.document.reload_links ? run.options.link_reload_delay : std::chrono::milliseconds(0);
  run.scheduler->EnqueueAfter(SyncJob{index, SyncStep::kSync}, delay);
}

void SyncOrchestrator::StepSync(RunState& run, std::size_t index) {
  auto&       rt = run.runtime[index];
  const auto& id = run.plan.entries[index].identity;

  if (!rt.handle) {
    throw std::logic_error("sync step without an open document for " + id.ToString());
  }

  if (run.board.State(index) == TaskState::kOpening) {
    run.board.Transition(index, TaskState::kSyncing);
  }

  ++rt.step_attempts;
  if (rt.step_attempts > 1) {
    run.board.Update(index, [](model::SyncTask& task) { ++task.attempt; });
  }

  try {
    gateway_->Sync(*rt.handle);
  } catch (const std::exception& e) {
    HandleFailure(run, index, SyncStep::kSync, e);
    return;
  }

  run.board.Transition(index, TaskState::kClosing);
  ReleaseHandle(run, index);
  run.board.Transition(index, TaskState::kSynced);

  LINKSYNC_LOG_INFO("Model synced", {obs::StringField("model", id.ToString()), obs::StringField("name", run.plan.entries[index].name)});
  Finish(run, index);
}

void SyncOrchestrator::HandleFailure(RunState& run, std::size_t index, SyncStep step, const std::exception& error) {
  auto&       rt   = run.runtime[index];
  const auto& id   = run.plan.entries[index].identity;
  const auto  kind = model::Classify(error);

  if (kind == ErrorKind::kGatewayUnavailable) {
    Halt(run, error.what());
    ReleaseHandle(run, index);
    Fail(run, index, kind, error.what());
    return;
  }

  if (run.options.retry.ShouldRetry(kind, rt.step_attempts)) {
    const auto wait = run.options.retry.BackoffFor(rt.step_attempts);
    LINKSYNC_LOG_WARN("Retrying sync step", {obs::StringField("model", id.ToString()), obs::StringField("step", ToString(step)),
                                             obs::StringField("error", model::ToString(kind)), obs::IntField("attempt", rt.step_attempts),
                                             obs::IntField("backoff_ms", wait.count())});
    obs::Metrics::Instance().RecordRetry(ToString(step));

    run.board.Update(index, [&](model::SyncTask& task) {
      task.last_error         = kind;
      task.last_error_message = error.what();
    });

    // a failed open is retried from scratch; a failed sync keeps its document
    if (step == SyncStep::kOpen) {
      ReleaseHandle(run, index);
    }
    run.scheduler->EnqueueAfter(SyncJob{index, step}, wait);
    return;
  }

  LINKSYNC_LOG_ERROR("Sync task failed", {obs::StringField("model", id.ToString()), obs::StringField("step", ToString(step)),
                                          obs::StringField("error", model::ToString(kind)), obs::StringField("detail", error.what())});
  ReleaseHandle(run, index);
  Fail(run, index, kind, error.what());
}

void SyncOrchestrator::ReleaseHandle(RunState& run, std::size_t index) {
  auto& rt = run.runtime[index];
  if (!rt.handle) return;

  ledger_->Release(rt.handle->id);
  rt.handle.reset();
}

void SyncOrchestrator::Fail(RunState& run, std::size_t index, ErrorKind kind, const std::string& message) {
  run.board.Transition(
      index, TaskState::kFailed,
      [&](model::SyncTask& task) {
        task.last_error         = kind;
        task.last_error_message = message;
      },
      std::string(model::ToString(kind)));
  Finish(run, index);
}

void SyncOrchestrator::Finish(RunState& run, std::size_t index) {
  const auto task = run.board.Snapshot(index);
  if (task.opened_at && task.finished_at) {
    obs::Metrics::Instance().ObserveTaskDurationMs(model::ToString(task.state),
                                                   static_cast<double>(util::MillisBetween(*task.opened_at, *task.finished_at)));
  }

  {
    std::lock_guard lock(run.mutex);
    --run.in_flight;
    ++run.completions;
  }
  run.cv.notify_all();
}

void SyncOrchestrator::Halt(RunState& run, const std::string& reason) {
  {
    std::lock_guard lock(run.mutex);
    if (run.halted.load()) return;
    run.abort_reason = reason;
    run.halted.store(true);
  }
  LINKSYNC_LOG_ERROR("Gateway unavailable, halting sync run", {obs::StringField("reason", reason)});
  run.scheduler->ExpediteDelayed();
  run.cv.notify_all();
}

// ------------------------------------------------------------
// Scheduling loop side
// ------------------------------------------------------------

void SyncOrchestrator::PropagateSkips(RunState& run) {
  // plan order is leaf first, so one pass reaches every ancestor
  for (std::size_t i = 0; i < run.plan.entries.size(); ++i) {
    if (run.board.State(i) != TaskState::kWaitingOnChildren) continue;

    for (auto child_index : run.children[i]) {
      const auto child = run.board.Snapshot(child_index);
      if (child.state != TaskState::kFailed && child.state != TaskState::kSkipped) continue;
      // Halt() is set before the failing task settles; an outage skips everything as GatewayUnavailable
      if (run.halted.load()) return;

      const auto origin = child.state == TaskState::kFailed ? child.identity : child.blocked_by.value_or(child.identity);
      run.board.Transition(
          i, TaskState::kSkipped,
          [&](model::SyncTask& task) {
            task.skip_reason        = SkipReason::kDependencyFailed;
            task.blocked_by         = origin;
            task.last_error         = child.last_error;
            task.last_error_message = child.last_error_message;
          },
          "blocked by " + origin.ToString());
      break;
    }
  }
}

void SyncOrchestrator::Dispatch(RunState& run) {
  const std::size_t limit = std::max<std::uint32_t>(1, run.options.max_concurrent_syncs);

  for (std::size_t i = 0; i < run.plan.entries.size(); ++i) {
    {
      std::lock_guard lock(run.mutex);
      if (run.in_flight >= limit) return;
    }

    if (run.halted.load()) return;
    if (run.board.State(i) != TaskState::kWaitingOnChildren) continue;

    const bool ready = std::all_of(run.children[i].begin(), run.children[i].end(),
                                   [&](std::size_t child) { return run.board.State(child) == TaskState::kSynced; });
    if (!ready) continue;

    {
      std::lock_guard lock(run.mutex);
      ++run.in_flight;
    }
    run.board.Transition(i, TaskState::kOpening);
    run.scheduler->Enqueue(SyncJob{i, SyncStep::kOpen});
  }
}

void SyncOrchestrator::SkipWaiting(RunState& run, SkipReason reason) {
  for (std::size_t i = 0; i < run.plan.entries.size(); ++i) {
    const auto state = run.board.State(i);
    if (state != TaskState::kQueued && state != TaskState::kWaitingOnChildren) continue;

    run.board.Transition(
        i, TaskState::kSkipped, [reason](model::SyncTask& task) { task.skip_reason = reason; }, std::string(model::ToString(reason)));
  }
}

RunResult SyncOrchestrator::Run(const planning::SyncPlan& plan, const RunOptions& options, const util::CancellationToken* cancel) {
  obs::SpanScope span("linksync.sync_run");
  span.SetAttribute("linksync.tasks", static_cast<std::int64_t>(plan.entries.size()));

  RunResult result;
  result.started_at = util::Now();

  const auto history_mark = events_->History().size();

  RunState run(plan, options, events_);

  LINKSYNC_LOG_INFO("Sync run started", {obs::IntField("explicit", static_cast<std::int64_t>(plan.ExplicitCount())),
                                         obs::IntField("implicit", static_cast<std::int64_t>(plan.ImplicitCount())),
                                         obs::IntField("concurrency", options.max_concurrent_syncs),
                                         obs::StringField("worksets", gateway::ToString(options.document.workset_mode))});

  for (std::size_t i = 0; i < plan.entries.size(); ++i) {
    run.board.Transition(i, TaskState::kWaitingOnChildren);
  }

  // never opened: discovery already showed the model cannot be read
  for (std::size_t i = 0; i < plan.entries.size(); ++i) {
    const auto& entry = plan.entries[i];
    if (!entry.discovery_error) continue;

    run.board.Transition(
        i, TaskState::kFailed,
        [&entry](model::SyncTask& task) {
          task.last_error         = entry.discovery_error;
          task.last_error_message = entry.discovery_error_message;
        },
        "discovery failed");
  }

  const std::size_t                        pool_size = std::max<std::uint32_t>(1, options.max_concurrent_syncs);
  std::vector<std::unique_ptr<SyncWorker>> workers;
  workers.reserve(pool_size);
  for (std::size_t i = 0; i < pool_size; ++i) {
    workers.push_back(std::make_unique<SyncWorker>(run.scheduler, [this, &run](const SyncJob& job) { Execute(run, job); }));
    workers.back()->Start();
  }

  result.status = RunStatus::kCompleted;
  while (true) {
    std::uint64_t seen;
    {
      std::lock_guard lock(run.mutex);
      seen = run.completions;
    }

    if (run.halted.load()) {
      result.status = RunStatus::kAborted;
      SkipWaiting(run, SkipReason::kGatewayUnavailable);
      break;
    }
    if (cancel && cancel->IsCancelled()) {
      result.status = RunStatus::kCancelled;
      LINKSYNC_LOG_WARN("Sync run cancelled, letting in-flight models finish");
      SkipWaiting(run, SkipReason::kCancelled);
      break;
    }

    PropagateSkips(run);
    Dispatch(run);

    if (run.board.AllTerminal()) break;

    std::unique_lock lock(run.mutex);
    run.cv.wait_for(lock, kPollInterval, [&] { return run.completions != seen || run.halted.load(); });
  }

  {
    std::unique_lock lock(run.mutex);
    run.cv.wait(lock, [&] { return run.in_flight == 0; });
  }

  for (auto& worker : workers) {
    worker->Stop();
  }
  workers.clear();

  // an outage that hit an in-flight task after cancellation still aborts the run
  if (run.halted.load()) {
    result.status = RunStatus::kAborted;
    SkipWaiting(run, SkipReason::kGatewayUnavailable);
  }

  const auto leftover = ledger_->Drain();
  if (leftover > 0) {
    LINKSYNC_LOG_WARN("Sync run left documents open", {obs::IntField("count", static_cast<std::int64_t>(leftover))});
  }

  {
    std::lock_guard lock(run.mutex);
    result.abort_reason = run.abort_reason;
  }
  result.tasks       = run.board.Tasks();
  result.finished_at = util::Now();

  auto history = events_->History();
  for (std::size_t i = history_mark; i < history.size(); ++i) {
    if (history[i].type == events::EventType::kTaskTransition) {
      result.transitions.push_back(std::move(history[i]));
    }
  }

  events::Event finished;
  finished.type   = events::EventType::kRunFinished;
  finished.detail = std::string(ToString(result.status));
  events_->Publish(std::move(finished));

  span.SetAttribute("linksync.status", ToString(result.status));
  LINKSYNC_LOG_INFO("Sync run finished", {obs::StringField("status", ToString(result.status)),
                                          obs::IntField("synced", static_cast<std::int64_t>(result.Count(TaskState::kSynced))),
                                          obs::IntField("failed", static_cast<std::int64_t>(result.Count(TaskState::kFailed))),
                                          obs::IntField("skipped", static_cast<std::int64_t>(result.Count(TaskState::kSkipped)))});
  return result;
}

} // namespace linksync::sync
