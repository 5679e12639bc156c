#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/gateway/cloud_document_gateway.hpp"
#include "internal/model/error_kind.hpp"
#include "internal/util/time.hpp"

namespace linksync::gateway::memory {

enum class Operation : std::uint8_t {
  kOpenDetached,
  kOpenFull,
  kReadLinks,
  kApplyOptions,
  kSync,
};

std::string_view ToString(Operation operation);
// snake_case names as used in catalog files. Throws std::invalid_argument.
Operation ParseOperation(std::string_view text);

struct SyncRecord {
  model::ModelIdentity identity;
  util::TimePoint      at;
};

/*
  Cloud host simulated in process memory.

  Holds a catalog of models and their links, hands out handles, and keeps
  full accounting of opens, closes and syncs so callers can check that
  every handle was closed exactly once. Faults can be scripted per model
  and operation, either for the next N calls or permanently.
*/
class MemoryGateway final : public CloudDocumentGateway {
 public:
  MemoryGateway();

  void AddModel(const model::ModelIdentity& id, std::string name, std::vector<std::string> worksets = {});

  // The child does not have to be in the catalog; opening it then fails with NotFound.
  void AddLink(const model::ModelIdentity& parent, const model::ModelIdentity& child, std::string name = {});
  void AddUnresolvedLink(const model::ModelIdentity& parent, std::string description);

  // times == 0 means every call fails.
  void InjectFault(const model::ModelIdentity& id, Operation operation, model::ErrorKind kind, std::uint32_t times = 0,
                   std::string message = {});
  void ClearFaults();

  // Every call throws GatewayUnavailable while set.
  void SetUnavailable(bool unavailable);
  void SetLatency(std::chrono::milliseconds latency);

  bool                 HasModel(const model::ModelIdentity& id) const;
  std::string          NameOf(const model::ModelIdentity& id) const;
  std::size_t          ModelCount() const;

  DocumentHandle      OpenDetached(const model::ModelIdentity& id) override;
  DocumentHandle      OpenFull(const model::ModelIdentity& id) override;
  LinkScan            ReadDirectLinks(const DocumentHandle& handle) override;
  model::ApplyOutcome ApplyOptions(const DocumentHandle& handle, const DocumentOptions& options) override;
  void                Sync(const DocumentHandle& handle) override;
  void                Close(const DocumentHandle& handle) noexcept override;

  // Accounting.
  std::uint64_t           OpenCount(const model::ModelIdentity& id, OpenMode mode) const;
  std::uint64_t           TotalOpens() const;
  std::uint64_t           TotalCloses() const;
  std::uint64_t           RedundantCloses() const;
  std::size_t             OpenHandles() const;
  std::size_t             PeakOpenHandles(OpenMode mode) const;
  std::uint64_t           SyncCount(const model::ModelIdentity& id) const;
  std::vector<SyncRecord> SyncLog() const;
  std::uint64_t           CallCount(const model::ModelIdentity& id, Operation operation) const;

 private:
  struct ModelRecord {
    std::string              name;
    std::vector<ModelLink>   links;
    std::vector<std::string> unresolved;
    std::vector<std::string> worksets;
  };

  struct Fault {
    model::ErrorKind kind;
    std::uint32_t    remaining;
    bool             permanent;
    std::string      message;
  };

  using FaultKey = std::pair<model::ModelIdentity, Operation>;

  // Counts the call, then throws if a fault is scripted. Caller holds the lock.
  void CheckFaultLocked(const model::ModelIdentity& id, Operation operation);
  DocumentHandle Open(const model::ModelIdentity& id, OpenMode mode, Operation operation);
  const DocumentHandle& RequireOpenLocked(const DocumentHandle& handle) const;
  void Pause() const;

  mutable std::mutex mutex_;

  std::unordered_map<model::ModelIdentity, ModelRecord>    models_;
  std::map<FaultKey, Fault>                                faults_;
  std::unordered_map<std::uint64_t, DocumentHandle>        open_;
  std::map<FaultKey, std::uint64_t>                        calls_;
  std::map<std::pair<model::ModelIdentity, OpenMode>, std::uint64_t> opens_;
  std::vector<SyncRecord>                                  sync_log_;

  bool                      unavailable_{false};
  std::chrono::milliseconds latency_{0};

  std::uint64_t next_handle_{1};
  std::uint64_t total_opens_{0};
  std::uint64_t total_closes_{0};
  std::uint64_t redundant_closes_{0};
  std::size_t   peak_detached_{0};
  std::size_t   peak_full_{0};
};

} // namespace linksync::gateway::memory
