#include "error_kind.hpp"

#include "internal/util/errors.hpp"

namespace linksync::model {

std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNotFound:
      return "NotFound";
    case ErrorKind::kAccessDenied:
      return "AccessDenied";
    case ErrorKind::kLocked:
      return "Locked";
    case ErrorKind::kTransientIO:
      return "TransientIO";
    case ErrorKind::kSyncConflict:
      return "SyncConflict";
    case ErrorKind::kCycleDetected:
      return "CycleDetected";
    case ErrorKind::kCorruptModel:
      return "CorruptModel";
    case ErrorKind::kGatewayUnavailable:
      return "GatewayUnavailable";
    case ErrorKind::kInternal:
      return "Internal";
  }
  return "Internal";
}

ErrorKind Classify(const std::exception& e) {
  using namespace linksync::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return ErrorKind::kNotFound;
  }
  if (dynamic_cast<const AccessDenied*>(&e)) {
    return ErrorKind::kAccessDenied;
  }
  if (dynamic_cast<const Locked*>(&e)) {
    return ErrorKind::kLocked;
  }
  if (dynamic_cast<const TransientIO*>(&e)) {
    return ErrorKind::kTransientIO;
  }
  if (dynamic_cast<const SyncConflict*>(&e)) {
    return ErrorKind::kSyncConflict;
  }
  if (dynamic_cast<const CycleDetected*>(&e)) {
    return ErrorKind::kCycleDetected;
  }
  if (dynamic_cast<const CorruptModel*>(&e)) {
    return ErrorKind::kCorruptModel;
  }
  if (dynamic_cast<const GatewayUnavailable*>(&e)) {
    return ErrorKind::kGatewayUnavailable;
  }

  return ErrorKind::kInternal;
}

} // namespace linksync::model
