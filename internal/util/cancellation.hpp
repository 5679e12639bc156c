#pragma once

#include <atomic>

namespace linksync::util {

// Shared stop flag. Cancel() may be called from any thread, including a signal handler.
class CancellationToken {
 public:
  void Cancel() noexcept {
    cancelled_.store(true, std::memory_order_release);
  }

  bool IsCancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

} // namespace linksync::util
