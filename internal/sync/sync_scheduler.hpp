#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

#include "sync_job.hpp"

namespace linksync::sync {

/*
  Thread-safe blocking queue for sync workers.

  Jobs enqueued with a delay stay invisible to Dequeue() until their due
  time, so a task waiting out a reload pause or a retry backoff does not
  hold a worker thread.
*/
class SyncScheduler {
 public:
  using Clock = std::chrono::steady_clock;

  void Enqueue(const SyncJob& job);
  void EnqueueAfter(const SyncJob& job, std::chrono::milliseconds delay);

  // blocking wait; nullopt once shut down and nothing is ready
  std::optional<SyncJob> Dequeue();

  // Makes every delayed job due now. Jobs enqueued with a delay afterwards
  // are due immediately as well.
  void ExpediteDelayed();

  void Shutdown();

  std::size_t ReadyCount() const;
  std::size_t DelayedCount() const;

 private:
  struct Delayed {
    Clock::time_point due;
    std::uint64_t     sequence;
    SyncJob           job;

    bool operator>(const Delayed& other) const {
      return due != other.due ? due > other.due : sequence > other.sequence;
    }
  };

  void PromoteDueLocked(Clock::time_point now);

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<SyncJob>     ready_;

  std::priority_queue<Delayed, std::vector<Delayed>, std::greater<>> delayed_;

  std::uint64_t next_sequence_ = 0;
  bool          shutdown_      = false;
  bool          expedited_     = false;
};

} // namespace linksync::sync
