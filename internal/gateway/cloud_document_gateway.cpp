#include "internal/gateway/cloud_document_gateway.hpp"

namespace linksync::gateway {

std::string_view ToString(OpenMode mode) {
  return mode == OpenMode::kFull ? "full" : "detached";
}

std::string_view ToString(WorksetOpeningMode mode) {
  switch (mode) {
    case WorksetOpeningMode::kAll:
      return "all";
    case WorksetOpeningMode::kLastViewed:
      return "last_viewed";
    case WorksetOpeningMode::kSpecify:
      return "specify";
  }
  return "all";
}

} // namespace linksync::gateway
