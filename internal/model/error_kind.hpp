#pragma once

#include <cstdint>
#include <exception>
#include <string_view>

namespace linksync::model {

enum class ErrorKind : std::uint8_t {
  kNotFound,
  kAccessDenied,
  kLocked,
  kTransientIO,
  kSyncConflict,
  kCycleDetected,
  kCorruptModel,
  kGatewayUnavailable,
  kInternal,
};

// Only lock contention and transient I/O are worth another attempt.
constexpr bool IsTransient(ErrorKind kind) {
  return kind == ErrorKind::kTransientIO || kind == ErrorKind::kLocked;
}

std::string_view ToString(ErrorKind kind);

/*
  Maps an exception thrown by a gateway (or by the engine) to its ErrorKind.

  Unknown exception types classify as kInternal.
*/
ErrorKind Classify(const std::exception& e);

} // namespace linksync::model
