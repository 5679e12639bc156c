#include "sync_worker.hpp"

#include "internal/observability/logging.hpp"

namespace linksync::sync {

namespace obs = linksync::observability;

SyncWorker::SyncWorker(std::shared_ptr<SyncScheduler> scheduler, Handler handler)
    : scheduler_(std::move(scheduler)), handler_(std::move(handler)) {
}

SyncWorker::~SyncWorker() {
  Stop();
}

void SyncWorker::Start() {
  running_ = true;
  thread_  = std::thread(&SyncWorker::Run, this);
}

void SyncWorker::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void SyncWorker::Run() {
  while (running_) {
    auto job = scheduler_->Dequeue();
    if (!job) break;

    try {
      handler_(*job);
    } catch (const std::exception& e) {
      LINKSYNC_LOG_ERROR("Sync job failed outside task handling",
                         {obs::IntField("task", static_cast<std::int64_t>(job->task_index)), obs::StringField("step", ToString(job->step)),
                          obs::StringField("error", e.what())});
    }
  }
}

} // namespace linksync::sync
