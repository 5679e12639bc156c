#include "task_board.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace linksync::sync {

namespace obs = linksync::observability;

using model::TaskState;

TaskBoard::TaskBoard(const planning::SyncPlan& plan, std::shared_ptr<events::EventChannel> events) : events_(std::move(events)) {
  tasks_.reserve(plan.entries.size());
  for (const auto& entry : plan.entries) {
    index_.emplace(entry.identity, tasks_.size());

    model::SyncTask task(entry.identity);
    task.name     = entry.name;
    task.implicit = entry.implicit;
    tasks_.push_back(std::move(task));
  }
}

std::size_t TaskBoard::Size() const {
  std::lock_guard lock(mutex_);
  return tasks_.size();
}

void TaskBoard::Transition(std::size_t index, TaskState to, const Mutator& mutate, const std::string& detail) {
  std::lock_guard lock(mutex_);
  auto&           task = tasks_.at(index);
  const auto      from = task.state;

  if (!model::CanTransition(from, to)) {
    throw std::logic_error("task " + task.identity.ToString() + ": illegal transition " + std::string(model::ToString(from)) + " -> " +
                           std::string(model::ToString(to)));
  }

  if (mutate) mutate(task);
  task.state = to;

  const auto now = util::Now();
  if (to == TaskState::kOpening) {
    task.opened_at = now;
  }
  if (model::IsTerminal(to)) {
    task.finished_at = now;
  }

  LINKSYNC_LOG_DEBUG("Task transition", {obs::StringField("model", task.identity.ToString()), obs::StringField("from", model::ToString(from)),
                                         obs::StringField("to", model::ToString(to))});

  // published under the board lock so history order matches transition order
  events_->PublishTransition(task.identity, from, to, detail);
}

void TaskBoard::Update(std::size_t index, const Mutator& mutate) {
  std::lock_guard lock(mutex_);
  mutate(tasks_.at(index));
}

TaskState TaskBoard::State(std::size_t index) const {
  std::lock_guard lock(mutex_);
  return tasks_.at(index).state;
}

model::SyncTask TaskBoard::Snapshot(std::size_t index) const {
  std::lock_guard lock(mutex_);
  return tasks_.at(index);
}

std::vector<model::SyncTask> TaskBoard::Tasks() const {
  std::lock_guard lock(mutex_);
  return tasks_;
}

std::optional<std::size_t> TaskBoard::IndexOf(const model::ModelIdentity& id) const {
  std::lock_guard lock(mutex_);
  auto            it = index_.find(id);
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

bool TaskBoard::AllTerminal() const {
  std::lock_guard lock(mutex_);
  return std::all_of(tasks_.begin(), tasks_.end(), [](const model::SyncTask& t) { return model::IsTerminal(t.state); });
}

} // namespace linksync::sync
