#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <thread>

#include "sync_scheduler.hpp"

namespace linksync::sync {

/*
  Pool thread that drains the sync scheduler.

  Executes:
      one step of one task per dequeued job
*/
class SyncWorker {
 public:
  using Handler = std::function<void(const SyncJob&)>;

  SyncWorker(std::shared_ptr<SyncScheduler> scheduler, Handler handler);
  ~SyncWorker();

  SyncWorker(const SyncWorker&)            = delete;
  SyncWorker& operator=(const SyncWorker&) = delete;

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<SyncScheduler> scheduler_;
  Handler                        handler_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace linksync::sync
