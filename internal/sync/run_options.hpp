#pragma once

#include <chrono>
#include <cstdint>

#include "internal/gateway/cloud_document_gateway.hpp"
#include "internal/retry/retry_policy.hpp"

namespace linksync::sync {

struct RunOptions {
  // Applied to every full open.
  gateway::DocumentOptions document;

  // Pause between applying options and syncing, so reloaded links settle.
  std::chrono::milliseconds link_reload_delay{2000};

  std::uint32_t      max_concurrent_syncs{2};
  retry::RetryPolicy retry;
};

} // namespace linksync::sync
