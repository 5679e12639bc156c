#include "internal/report/run_report.hpp"

#include <google/protobuf/util/json_util.h>

#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include "internal/util/time.hpp"

namespace linksync::report {

namespace v1 = linksync::v1;

using model::ModelIdentity;
using model::TaskState;

v1::ModelRef ToModelRef(const ModelIdentity& id, const std::string& name) {
  v1::ModelRef ref;
  ref.set_region(std::string(model::ToString(id.region())));
  ref.set_project_id(id.project_id());
  ref.set_model_id(id.model_id());
  ref.set_name(name);
  return ref;
}

v1::ErrorKind ToProto(model::ErrorKind kind) {
  switch (kind) {
    case model::ErrorKind::kNotFound:
      return v1::ERROR_KIND_NOT_FOUND;
    case model::ErrorKind::kAccessDenied:
      return v1::ERROR_KIND_ACCESS_DENIED;
    case model::ErrorKind::kLocked:
      return v1::ERROR_KIND_LOCKED;
    case model::ErrorKind::kTransientIO:
      return v1::ERROR_KIND_TRANSIENT_IO;
    case model::ErrorKind::kSyncConflict:
      return v1::ERROR_KIND_SYNC_CONFLICT;
    case model::ErrorKind::kCycleDetected:
      return v1::ERROR_KIND_CYCLE_DETECTED;
    case model::ErrorKind::kCorruptModel:
      return v1::ERROR_KIND_CORRUPT_MODEL;
    case model::ErrorKind::kGatewayUnavailable:
      return v1::ERROR_KIND_GATEWAY_UNAVAILABLE;
    case model::ErrorKind::kInternal:
      return v1::ERROR_KIND_INTERNAL;
  }
  return v1::ERROR_KIND_UNSPECIFIED;
}

v1::TaskState ToProto(TaskState state) {
  switch (state) {
    case TaskState::kQueued:
      return v1::TASK_STATE_QUEUED;
    case TaskState::kWaitingOnChildren:
      return v1::TASK_STATE_WAITING_ON_CHILDREN;
    case TaskState::kOpening:
      return v1::TASK_STATE_OPENING;
    case TaskState::kSyncing:
      return v1::TASK_STATE_SYNCING;
    case TaskState::kClosing:
      return v1::TASK_STATE_CLOSING;
    case TaskState::kSynced:
      return v1::TASK_STATE_SYNCED;
    case TaskState::kFailed:
      return v1::TASK_STATE_FAILED;
    case TaskState::kSkipped:
      return v1::TASK_STATE_SKIPPED;
  }
  return v1::TASK_STATE_UNSPECIFIED;
}

v1::DiscoveryState ToProto(graph::DiscoveryState state) {
  switch (state) {
    case graph::DiscoveryState::kPending:
      return v1::DISCOVERY_STATE_PENDING;
    case graph::DiscoveryState::kDiscovering:
      return v1::DISCOVERY_STATE_DISCOVERING;
    case graph::DiscoveryState::kDiscovered:
      return v1::DISCOVERY_STATE_DISCOVERED;
    case graph::DiscoveryState::kFailed:
      return v1::DISCOVERY_STATE_FAILED;
  }
  return v1::DISCOVERY_STATE_UNSPECIFIED;
}

v1::RunStatus ToProto(sync::RunStatus status) {
  switch (status) {
    case sync::RunStatus::kCompleted:
      return v1::RUN_STATUS_COMPLETED;
    case sync::RunStatus::kCancelled:
      return v1::RUN_STATUS_CANCELLED;
    case sync::RunStatus::kAborted:
      return v1::RUN_STATUS_ABORTED;
  }
  return v1::RUN_STATUS_UNSPECIFIED;
}

v1::DiscoveryReport BuildDiscoveryReport(const graph::DependencyGraph& graph, bool cancelled, const std::vector<ModelIdentity>& order,
                                         const std::vector<ModelIdentity>& cycle) {
  v1::DiscoveryReport report;

  const auto& root = graph.Node(graph.Root());
  *report.mutable_root() = ToModelRef(root.identity, root.name);
  report.set_cancelled(cancelled);

  for (const auto& id : graph.DiscoveryOrder()) {
    const auto& node  = graph.Node(id);
    auto*       model = report.add_models();

    *model->mutable_model() = ToModelRef(node.identity, node.name);
    model->set_state(ToProto(node.state));
    for (const auto& child : node.children) {
      *model->add_children() = ToModelRef(child, graph.Node(child).name);
    }
    if (node.error) {
      model->set_error(ToProto(*node.error));
      model->set_error_message(node.error_message);
    }
    for (const auto& skipped : node.skipped_links) {
      model->add_skipped_links(skipped);
    }
  }

  for (const auto& id : order) {
    *report.add_order() = ToModelRef(id, graph.Node(id).name);
  }
  for (const auto& id : cycle) {
    *report.add_cycle() = ToModelRef(id, graph.Node(id).name);
  }

  return report;
}

namespace {

v1::TaskOutcome ToOutcome(const model::SyncTask& task, const std::unordered_map<ModelIdentity, std::string>& names) {
  v1::TaskOutcome outcome;
  *outcome.mutable_model() = ToModelRef(task.identity, task.name);
  outcome.set_state(ToProto(task.state));
  outcome.set_implicit(task.implicit);
  outcome.set_attempts(task.attempt);

  if (task.state != TaskState::kSynced && task.last_error) {
    outcome.set_error(ToProto(*task.last_error));
    outcome.set_error_message(task.last_error_message);
  }
  if (task.skip_reason != model::SkipReason::kNone) {
    outcome.set_skip_reason(std::string(model::ToString(task.skip_reason)));
  }
  if (task.blocked_by) {
    auto it                       = names.find(*task.blocked_by);
    *outcome.mutable_blocked_by() = ToModelRef(*task.blocked_by, it == names.end() ? std::string() : it->second);
  }

  outcome.set_worksets_opened(task.applied.worksets_opened);
  outcome.set_worksets_still_closed(task.applied.worksets_still_closed);
  outcome.set_links_reloaded(task.applied.links_reloaded);
  outcome.set_link_failures(task.applied.link_failures);

  if (task.opened_at && task.finished_at) {
    outcome.set_duration_ms(util::MillisBetween(*task.opened_at, *task.finished_at));
  }
  return outcome;
}

std::string Label(const model::SyncTask& task) {
  return task.name.empty() ? task.identity.ToString() : task.name + " (" + task.identity.ToString() + ")";
}

} // namespace

v1::SyncReport BuildSyncReport(const sync::RunResult& result) {
  std::unordered_map<ModelIdentity, std::string> names;
  for (const auto& task : result.tasks) {
    names.emplace(task.identity, task.name);
  }

  v1::SyncReport report;
  report.set_status(ToProto(result.status));
  report.set_abort_reason(result.abort_reason);

  for (const auto& task : result.tasks) {
    auto outcome = ToOutcome(task, names);
    if (task.implicit) {
      *report.add_implicit_tasks() = std::move(outcome);
    } else {
      *report.add_explicit_tasks() = std::move(outcome);
    }
  }

  report.set_synced(static_cast<std::uint32_t>(result.Count(TaskState::kSynced)));
  report.set_failed(static_cast<std::uint32_t>(result.Count(TaskState::kFailed)));
  report.set_skipped(static_cast<std::uint32_t>(result.Count(TaskState::kSkipped)));
  *report.mutable_started_at()  = util::ToProto(result.started_at);
  *report.mutable_finished_at() = util::ToProto(result.finished_at);
  return report;
}

std::string FormatDiscoverySummary(const graph::DependencyGraph& graph, const std::vector<ModelIdentity>& order,
                                   const std::vector<ModelIdentity>& cycle) {
  std::ostringstream out;

  out << "Linked models (" << graph.Size() << ")\n";
  for (const auto& row : graph.FormatTree()) {
    out << std::string(row.depth * 2, ' ') << "- " << (row.name.empty() ? row.identity.ShortName() : row.name) << "  "
        << row.identity.ToString();
    if (row.repeated) {
      out << "  [circular]";
    } else if (row.state != graph::DiscoveryState::kDiscovered) {
      const auto& node = graph.Node(row.identity);
      out << "  [" << graph::ToString(row.state);
      if (node.error) {
        out << ": " << model::ToString(*node.error);
      }
      out << "]";
    }
    out << "\n";

    if (!row.repeated) {
      for (const auto& skipped : graph.Node(row.identity).skipped_links) {
        out << std::string(row.depth * 2 + 2, ' ') << "! skipped link: " << skipped << "\n";
      }
    }
  }

  if (!cycle.empty()) {
    out << "\nCircular links:";
    for (const auto& id : cycle) {
      out << " " << graph.Node(id).name << " ->";
    }
    out << " " << graph.Node(cycle.front()).name << "\n";
  } else if (!order.empty()) {
    out << "\nSync order (leaf first)\n";
    for (std::size_t i = 0; i < order.size(); ++i) {
      out << "  " << (i + 1) << ". " << graph.Node(order[i]).name << "  " << order[i].ToString() << "\n";
    }
  }

  return out.str();
}

std::string FormatSyncSummary(const sync::RunResult& result) {
  std::unordered_map<ModelIdentity, std::string> names;
  for (const auto& task : result.tasks) {
    names.emplace(task.identity, task.name);
  }

  std::ostringstream out;
  auto               section = [&](const char* title, const std::vector<model::SyncTask>& tasks) {
    if (tasks.empty()) return;
    out << title << "\n";
    for (const auto& task : tasks) {
      out << "  " << model::ToString(task.state) << "  " << Label(task);
      if (task.state == TaskState::kFailed && task.last_error) {
        out << "  error=" << model::ToString(*task.last_error);
        if (!task.last_error_message.empty()) out << " (" << task.last_error_message << ")";
      }
      if (task.state == TaskState::kSkipped) {
        out << "  reason=" << model::ToString(task.skip_reason);
        if (task.last_error) out << "  error=" << model::ToString(*task.last_error);
        if (task.blocked_by) {
          auto it = names.find(*task.blocked_by);
          out << "  blocked_by=" << (it == names.end() || it->second.empty() ? task.blocked_by->ToString() : it->second);
        }
      }
      if (task.attempt > 1) out << "  attempts=" << task.attempt;
      out << "\n";
    }
  };

  section("Selected models", result.ExplicitTasks());
  section("Included dependencies", result.ImplicitTasks());

  out << "Run " << sync::ToString(result.status);
  if (!result.abort_reason.empty()) out << " (" << result.abort_reason << ")";
  out << ": " << result.Count(TaskState::kSynced) << " synced, " << result.Count(TaskState::kFailed) << " failed, "
      << result.Count(TaskState::kSkipped) << " skipped in " << util::MillisBetween(result.started_at, result.finished_at) << " ms\n";
  return out.str();
}

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to render report as JSON: " + std::string(status.message()));
  }
  return json;
}

} // namespace linksync::report
