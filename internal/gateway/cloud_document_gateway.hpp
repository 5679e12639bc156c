#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/model_identity.hpp"
#include "internal/model/sync_task.hpp"

namespace linksync::gateway {

enum class OpenMode : std::uint8_t {
  // Read-only, no edit locks, worksets closed. Inspection only.
  kDetached,
  // Edit and sync rights against the central model.
  kFull,
};

std::string_view ToString(OpenMode mode);

enum class WorksetOpeningMode : std::uint8_t {
  kAll,
  kLastViewed,
  kSpecify,
};

std::string_view ToString(WorksetOpeningMode mode);

struct DocumentHandle {
  std::uint64_t        id{0};
  model::ModelIdentity identity;
  OpenMode             mode{OpenMode::kDetached};
};

struct ModelLink {
  model::ModelIdentity identity;
  std::string          name;
};

struct LinkScan {
  std::vector<ModelLink> links;
  // Links that could not be resolved to a cloud model (local files, nested links, ...).
  std::vector<std::string> skipped;
};

struct DocumentOptions {
  WorksetOpeningMode       workset_mode{WorksetOpeningMode::kAll};
  std::vector<std::string> worksets;
  bool                     reload_links{true};
  bool                     reload_latest{true};
};

/*
  Capability interface to the cloud document host.

  The engine only ever sees these two open modes: discovery uses detached
  opens, sync runs use full opens. Failures are reported by throwing the
  types in internal/util/errors.hpp; any call may throw GatewayUnavailable
  when the host cannot be reached.

  Implementations must be safe to call from several threads at once.
*/
class CloudDocumentGateway {
 public:
  virtual ~CloudDocumentGateway() = default;

  // Throws NotFound, AccessDenied, TransientIO, CorruptModel.
  virtual DocumentHandle OpenDetached(const model::ModelIdentity& id) = 0;

  // Throws NotFound, AccessDenied, Locked, TransientIO, CorruptModel.
  virtual DocumentHandle OpenFull(const model::ModelIdentity& id) = 0;

  virtual LinkScan ReadDirectLinks(const DocumentHandle& handle) = 0;

  // Workset policy, link reload, reload-latest.
  virtual model::ApplyOutcome ApplyOptions(const DocumentHandle& handle, const DocumentOptions& options) = 0;

  // Throws SyncConflict, TransientIO.
  virtual void Sync(const DocumentHandle& handle) = 0;

  // Idempotent. Errors are logged, never thrown.
  virtual void Close(const DocumentHandle& handle) noexcept = 0;
};

using CloudDocumentGatewayPtr = std::shared_ptr<CloudDocumentGateway>;

} // namespace linksync::gateway
