#include "internal/events/event_channel.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

using linksync::events::EventChannel;
using linksync::events::EventType;
using linksync::model::ModelIdentity;
using linksync::model::Region;
using linksync::model::TaskState;

void TestPublishIsQueuedAndRecorded() {
  EventChannel  channel;
  ModelIdentity id(Region::kUS, "p", "m");

  channel.PublishProgress(id, "Scanning");
  channel.PublishTransition(id, TaskState::kQueued, TaskState::kWaitingOnChildren);

  auto first = channel.Poll();
  assert(first && first->type == EventType::kDiscoveryProgress && first->sequence == 1);
  auto second = channel.Poll();
  assert(second && second->type == EventType::kTaskTransition && second->to == TaskState::kWaitingOnChildren);
  assert(!channel.Poll());

  const auto history = channel.History();
  assert(history.size() == 2);
  assert(history[0].at <= history[1].at);
}

void TestDescribeNamesTheTransition() {
  EventChannel  channel;
  ModelIdentity id(Region::kEMEA, "p", "m");
  channel.PublishTransition(id, TaskState::kOpening, TaskState::kFailed, "Locked");

  const auto line = linksync::events::Describe(*channel.Poll());
  assert(line == "[transition] EMEA/p/m Opening -> Failed Locked");
}

void TestWaitNextWakesOnPublish() {
  EventChannel channel;

  std::thread producer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.PublishProgress(ModelIdentity(Region::kUS, "p", "m"), "late");
  });

  auto event = channel.WaitNext(std::chrono::seconds(5));
  producer.join();
  assert(event && event->detail == "late");
}

void TestCloseStopsQueueingButKeepsHistory() {
  EventChannel channel;
  channel.Close();
  assert(channel.Closed());

  for (int i = 0; i < 100; ++i) {
    channel.PublishProgress(ModelIdentity(Region::kUS, "p", "m"), "after close");
  }
  assert(!channel.Poll());
  assert(!channel.WaitNext(std::chrono::milliseconds(1)));
  assert(channel.History().size() == 100);
}

} // namespace

int main() {
  TestPublishIsQueuedAndRecorded();
  TestDescribeNamesTheTransition();
  TestWaitNextWakesOnPublish();
  TestCloseStopsQueueingButKeepsHistory();

  std::cout << "linksync_unit_event_channel: pass\n";
  return 0;
}
