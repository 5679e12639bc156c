#include "sync_scheduler.hpp"

namespace linksync::sync {

void SyncScheduler::Enqueue(const SyncJob& job) {
  {
    std::lock_guard lock(mutex_);
    ready_.push(job);
  }
  cv_.notify_one();
}

void SyncScheduler::EnqueueAfter(const SyncJob& job, std::chrono::milliseconds delay) {
  {
    std::lock_guard lock(mutex_);
    if (delay.count() <= 0 || expedited_) {
      ready_.push(job);
    } else {
      delayed_.push(Delayed{Clock::now() + delay, next_sequence_++, job});
    }
  }
  // a sleeping worker may need to shorten its wait
  cv_.notify_all();
}

void SyncScheduler::PromoteDueLocked(Clock::time_point now) {
  while (!delayed_.empty() && delayed_.top().due <= now) {
    ready_.push(delayed_.top().job);
    delayed_.pop();
  }
}

std::optional<SyncJob> SyncScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  while (true) {
    PromoteDueLocked(Clock::now());

    if (!ready_.empty()) {
      SyncJob job = ready_.front();
      ready_.pop();
      return job;
    }

    if (shutdown_ && delayed_.empty()) return std::nullopt;

    if (delayed_.empty()) {
      cv_.wait(lock, [&] { return shutdown_ || !ready_.empty() || !delayed_.empty(); });
    } else {
      cv_.wait_until(lock, delayed_.top().due);
    }
  }
}

void SyncScheduler::ExpediteDelayed() {
  {
    std::lock_guard lock(mutex_);
    expedited_ = true;
    while (!delayed_.empty()) {
      ready_.push(delayed_.top().job);
      delayed_.pop();
    }
  }
  cv_.notify_all();
}

void SyncScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t SyncScheduler::ReadyCount() const {
  std::lock_guard lock(mutex_);
  return ready_.size();
}

std::size_t SyncScheduler::DelayedCount() const {
  std::lock_guard lock(mutex_);
  return delayed_.size();
}

} // namespace linksync::sync
