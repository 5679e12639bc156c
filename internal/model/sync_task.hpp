#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "internal/model/error_kind.hpp"
#include "internal/model/model_identity.hpp"
#include "internal/util/time.hpp"

namespace linksync::model {

enum class TaskState : std::uint8_t {
  kQueued            = 0,
  kWaitingOnChildren = 1,
  kOpening           = 2,
  kSyncing           = 3,
  kClosing           = 4,
  kSynced            = 5,
  kFailed            = 6,
  kSkipped           = 7,
};

enum class SkipReason : std::uint8_t {
  kNone,
  kDependencyFailed,
  kCancelled,
  kGatewayUnavailable,
};

constexpr bool IsTerminal(TaskState state) {
  return state == TaskState::kSynced || state == TaskState::kFailed || state == TaskState::kSkipped;
}

/*
  Queued -> WaitingOnChildren -> Opening -> Syncing -> Closing -> Synced

  Opening|Syncing|Closing may fail. Queued|WaitingOnChildren may be skipped.
  A task whose discovery failed goes from WaitingOnChildren straight to Failed.
*/
constexpr bool CanTransition(TaskState from, TaskState to) {
  if (IsTerminal(from)) {
    return false;
  }

  switch (to) {
    case TaskState::kQueued:
      return false;
    case TaskState::kWaitingOnChildren:
      return from == TaskState::kQueued;
    case TaskState::kOpening:
      return from == TaskState::kWaitingOnChildren;
    case TaskState::kSyncing:
      return from == TaskState::kOpening;
    case TaskState::kClosing:
      return from == TaskState::kSyncing;
    case TaskState::kSynced:
      return from == TaskState::kClosing;
    case TaskState::kFailed:
      return from == TaskState::kOpening || from == TaskState::kSyncing || from == TaskState::kClosing ||
             from == TaskState::kWaitingOnChildren;
    case TaskState::kSkipped:
      return from == TaskState::kQueued || from == TaskState::kWaitingOnChildren;
  }
  return false;
}

std::string_view ToString(TaskState state);
std::string_view ToString(SkipReason reason);

// Statistics returned by the gateway when run options are applied.
struct ApplyOutcome {
  std::uint32_t worksets_opened{0};
  std::uint32_t worksets_still_closed{0};
  std::uint32_t links_reloaded{0};
  std::uint32_t link_failures{0};
};

struct SyncTask {
  explicit SyncTask(ModelIdentity id) : identity(std::move(id)) {
  }

  ModelIdentity identity;
  std::string   name;
  TaskState     state{TaskState::kQueued};
  bool          implicit{false};

  std::uint32_t            attempt{0};
  std::optional<ErrorKind> last_error;
  std::string              last_error_message;

  SkipReason                   skip_reason{SkipReason::kNone};
  std::optional<ModelIdentity> blocked_by;

  ApplyOutcome applied;

  std::optional<util::TimePoint> opened_at;
  std::optional<util::TimePoint> finished_at;
};

} // namespace linksync::model
