#include "internal/model/error_kind.hpp"
#include "internal/model/sync_task.hpp"
#include "internal/util/errors.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

namespace {

using linksync::model::CanTransition;
using linksync::model::Classify;
using linksync::model::ErrorKind;
using linksync::model::IsTerminal;
using linksync::model::IsTransient;
using linksync::model::TaskState;

void TestHappyPath() {
  assert(CanTransition(TaskState::kQueued, TaskState::kWaitingOnChildren));
  assert(CanTransition(TaskState::kWaitingOnChildren, TaskState::kOpening));
  assert(CanTransition(TaskState::kOpening, TaskState::kSyncing));
  assert(CanTransition(TaskState::kSyncing, TaskState::kClosing));
  assert(CanTransition(TaskState::kClosing, TaskState::kSynced));
}

void TestFailureAndSkipEdges() {
  assert(CanTransition(TaskState::kOpening, TaskState::kFailed));
  assert(CanTransition(TaskState::kSyncing, TaskState::kFailed));
  assert(CanTransition(TaskState::kClosing, TaskState::kFailed));
  assert(CanTransition(TaskState::kQueued, TaskState::kSkipped));
  assert(CanTransition(TaskState::kWaitingOnChildren, TaskState::kSkipped));

  assert(!CanTransition(TaskState::kOpening, TaskState::kSkipped));
  assert(!CanTransition(TaskState::kQueued, TaskState::kOpening));
  assert(!CanTransition(TaskState::kWaitingOnChildren, TaskState::kSynced));
}

void TestTerminalStatesHaveNoExits() {
  for (auto terminal : {TaskState::kSynced, TaskState::kFailed, TaskState::kSkipped}) {
    assert(IsTerminal(terminal));
    for (auto to : {TaskState::kQueued, TaskState::kWaitingOnChildren, TaskState::kOpening, TaskState::kSyncing, TaskState::kClosing,
                    TaskState::kSynced, TaskState::kFailed, TaskState::kSkipped}) {
      assert(!CanTransition(terminal, to));
    }
  }
}

void TestClassification() {
  assert(Classify(linksync::util::NotFound("x")) == ErrorKind::kNotFound);
  assert(Classify(linksync::util::Locked("x")) == ErrorKind::kLocked);
  assert(Classify(linksync::util::TransientIO("x")) == ErrorKind::kTransientIO);
  assert(Classify(linksync::util::GatewayUnavailable("x")) == ErrorKind::kGatewayUnavailable);
  assert(Classify(std::runtime_error("x")) == ErrorKind::kInternal);

  assert(IsTransient(ErrorKind::kTransientIO));
  assert(IsTransient(ErrorKind::kLocked));
  assert(!IsTransient(ErrorKind::kSyncConflict));
  assert(!IsTransient(ErrorKind::kNotFound));
}

} // namespace

int main() {
  TestHappyPath();
  TestFailureAndSkipEdges();
  TestTerminalStatesHaveNoExits();
  TestClassification();

  std::cout << "linksync_unit_task_state: pass\n";
  return 0;
}
