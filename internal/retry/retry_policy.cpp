#include "internal/retry/retry_policy.hpp"

#include <limits>

namespace linksync::retry {

bool RetryPolicy::ShouldRetry(model::ErrorKind kind, std::uint32_t failed_attempts) const {
  return model::IsTransient(kind) && failed_attempts <= max_retry_attempts;
}

std::chrono::milliseconds RetryPolicy::BackoffFor(std::uint32_t retry_number) const {
  if (retry_number == 0 || backoff_base.count() <= 0) {
    return std::chrono::milliseconds(0);
  }

  using Rep      = std::chrono::milliseconds::rep;
  const Rep cap  = max_backoff.count() > 0 ? max_backoff.count() : std::numeric_limits<Rep>::max();
  Rep       wait = backoff_base.count();
  for (std::uint32_t i = 1; i < retry_number; ++i) {
    if (wait > cap / 2) {
      wait = cap;
      break;
    }
    wait *= 2;
  }

  return std::chrono::milliseconds(wait < cap ? wait : cap);
}

} // namespace linksync::retry
