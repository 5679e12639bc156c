#pragma once

#include <chrono>
#include <cstdint>

#include "internal/model/error_kind.hpp"

namespace linksync::retry {

/*
  Retry schedule for gateway calls.

  Only transient kinds are retried, at most max_retry_attempts times on top
  of the first attempt. The wait before retry n is base * 2^(n-1), capped at
  max_backoff when that is non-zero.
*/
struct RetryPolicy {
  std::uint32_t             max_retry_attempts{0};
  std::chrono::milliseconds backoff_base{0};
  std::chrono::milliseconds max_backoff{0};

  // failed_attempts counts the attempt that just failed (first attempt = 1).
  bool ShouldRetry(model::ErrorKind kind, std::uint32_t failed_attempts) const;

  std::chrono::milliseconds BackoffFor(std::uint32_t retry_number) const;
};

} // namespace linksync::retry
