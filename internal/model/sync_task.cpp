#include "sync_task.hpp"

namespace linksync::model {

std::string_view ToString(TaskState state) {
  switch (state) {
    case TaskState::kQueued:
      return "Queued";
    case TaskState::kWaitingOnChildren:
      return "WaitingOnChildren";
    case TaskState::kOpening:
      return "Opening";
    case TaskState::kSyncing:
      return "Syncing";
    case TaskState::kClosing:
      return "Closing";
    case TaskState::kSynced:
      return "Synced";
    case TaskState::kFailed:
      return "Failed";
    case TaskState::kSkipped:
      return "Skipped";
  }
  return "Unknown";
}

std::string_view ToString(SkipReason reason) {
  switch (reason) {
    case SkipReason::kNone:
      return "";
    case SkipReason::kDependencyFailed:
      return "dependency failed";
    case SkipReason::kCancelled:
      return "cancelled";
    case SkipReason::kGatewayUnavailable:
      return "gateway unavailable";
  }
  return "";
}

} // namespace linksync::model
