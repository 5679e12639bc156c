#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/model_identity.hpp"
#include "internal/model/sync_task.hpp"
#include "internal/util/time.hpp"

namespace linksync::events {

enum class EventType : std::uint8_t {
  kDiscoveryProgress,
  kTaskTransition,
  kRunFinished,
};

std::string_view ToString(EventType type);

struct Event {
  std::uint64_t   sequence{0};
  EventType       type{EventType::kDiscoveryProgress};
  util::TimePoint at{};

  std::optional<model::ModelIdentity> identity;

  // kTaskTransition only.
  model::TaskState from{model::TaskState::kQueued};
  model::TaskState to{model::TaskState::kQueued};

  std::string detail;
};

// One line for terminals and logs.
std::string Describe(const Event& event);

/*
  Progress notifications from discovery and sync runs.

  Publish() never blocks on consumers: events are appended to a pending
  queue that consumers Poll() or WaitNext() from, and to a history that
  stays readable after the run. Sequence numbers and timestamps are
  assigned at publish time, under the channel lock, so history order is
  publish order.
*/
class EventChannel {
 public:
  void Publish(Event event);

  void PublishProgress(const model::ModelIdentity& id, std::string detail);
  void PublishTransition(const model::ModelIdentity& id, model::TaskState from, model::TaskState to, std::string detail = {});

  std::optional<Event> Poll();

  // Returns nullopt on timeout or once the channel is closed and empty.
  std::optional<Event> WaitNext(std::chrono::milliseconds timeout);

  // Wakes waiting consumers; later Publish() calls still land in history.
  void Close();
  bool Closed() const;

  std::vector<Event> History() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<Event>       pending_;
  std::vector<Event>      history_;
  std::uint64_t           next_sequence_{1};
  bool                    closed_{false};
};

} // namespace linksync::events
