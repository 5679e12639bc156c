#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace linksync::sync {

enum class SyncStep : std::uint8_t {
  // Full open, then run options.
  kOpen,
  // Sync with central, then close.
  kSync,
};

inline std::string_view ToString(SyncStep step) {
  return step == SyncStep::kOpen ? "open" : "sync";
}

/*
  One unit of work for the sync worker pool: the next step of one task.

  A task has at most one job queued or running at any time.
*/
struct SyncJob {
  std::size_t task_index{0};
  SyncStep    step{SyncStep::kOpen};
};

} // namespace linksync::sync
