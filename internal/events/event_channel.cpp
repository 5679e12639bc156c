#include "internal/events/event_channel.hpp"

#include <utility>

namespace linksync::events {

std::string_view ToString(EventType type) {
  switch (type) {
    case EventType::kDiscoveryProgress:
      return "discovery";
    case EventType::kTaskTransition:
      return "transition";
    case EventType::kRunFinished:
      return "finished";
  }
  return "unknown";
}

std::string Describe(const Event& event) {
  std::string line = "[" + std::string(ToString(event.type)) + "]";
  if (event.identity) {
    line += " " + event.identity->ToString();
  }
  if (event.type == EventType::kTaskTransition) {
    line += " " + std::string(model::ToString(event.from)) + " -> " + std::string(model::ToString(event.to));
  }
  if (!event.detail.empty()) {
    line += " " + event.detail;
  }
  return line;
}

void EventChannel::Publish(Event event) {
  {
    std::lock_guard lock(mutex_);
    event.sequence = next_sequence_++;
    event.at       = util::Now();
    history_.push_back(event);
    if (!closed_) {
      pending_.push_back(std::move(event));
    }
  }
  cv_.notify_one();
}

void EventChannel::PublishProgress(const model::ModelIdentity& id, std::string detail) {
  Event event;
  event.type     = EventType::kDiscoveryProgress;
  event.identity = id;
  event.detail   = std::move(detail);
  Publish(std::move(event));
}

void EventChannel::PublishTransition(const model::ModelIdentity& id, model::TaskState from, model::TaskState to, std::string detail) {
  Event event;
  event.type     = EventType::kTaskTransition;
  event.identity = id;
  event.from     = from;
  event.to       = to;
  event.detail   = std::move(detail);
  Publish(std::move(event));
}

std::optional<Event> EventChannel::Poll() {
  std::lock_guard lock(mutex_);
  if (pending_.empty()) return std::nullopt;

  Event event = std::move(pending_.front());
  pending_.pop_front();
  return event;
}

std::optional<Event> EventChannel::WaitNext(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  cv_.wait_for(lock, timeout, [&] { return closed_ || !pending_.empty(); });

  if (pending_.empty()) return std::nullopt;

  Event event = std::move(pending_.front());
  pending_.pop_front();
  return event;
}

void EventChannel::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool EventChannel::Closed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

std::vector<Event> EventChannel::History() const {
  std::lock_guard lock(mutex_);
  return history_;
}

} // namespace linksync::events
