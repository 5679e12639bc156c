#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/events/event_channel.hpp"
#include "internal/model/sync_task.hpp"
#include "internal/planning/sync_plan.hpp"

namespace linksync::sync {

/*
  The tasks of one sync run, indexed in plan order.

  Transition() is the only way a task's state changes. It validates the
  edge, applies the caller's field updates under the same lock, stamps
  timestamps and publishes the transition event.
*/
class TaskBoard {
 public:
  using Mutator = std::function<void(model::SyncTask&)>;

  TaskBoard(const planning::SyncPlan& plan, std::shared_ptr<events::EventChannel> events);

  std::size_t Size() const;

  // Throws std::logic_error on an illegal edge.
  void Transition(std::size_t index, model::TaskState to, const Mutator& mutate = {}, const std::string& detail = {});

  // Field updates that do not change state (attempt counters, apply statistics).
  void Update(std::size_t index, const Mutator& mutate);

  model::TaskState State(std::size_t index) const;
  model::SyncTask  Snapshot(std::size_t index) const;

  std::vector<model::SyncTask> Tasks() const;

  std::optional<std::size_t> IndexOf(const model::ModelIdentity& id) const;

  bool AllTerminal() const;

 private:
  mutable std::mutex                                   mutex_;
  std::vector<model::SyncTask>                         tasks_;
  std::unordered_map<model::ModelIdentity, std::size_t> index_;
  std::shared_ptr<events::EventChannel>                events_;
};

} // namespace linksync::sync
