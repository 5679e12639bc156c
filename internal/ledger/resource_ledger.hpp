#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "internal/gateway/cloud_document_gateway.hpp"

namespace linksync::ledger {

/*
  Tracks every document handle currently open against the gateway.

  Release() closes a handle exactly once; releasing an unknown or already
  released handle is a no-op. Drain() closes whatever is still open and is
  run before a sync run or a discovery reports its outcome.
*/
class ResourceLedger {
 public:
  explicit ResourceLedger(gateway::CloudDocumentGatewayPtr gateway);
  ~ResourceLedger();

  ResourceLedger(const ResourceLedger&)            = delete;
  ResourceLedger& operator=(const ResourceLedger&) = delete;

  void Register(const gateway::DocumentHandle& handle);

  // Returns true if this call closed the handle.
  bool Release(std::uint64_t handle_id);

  // Closes all open handles. Returns how many were closed.
  std::size_t Drain();

  std::size_t OpenCount() const;
  bool        Holds(std::uint64_t handle_id) const;
  bool        HoldsModel(const model::ModelIdentity& id) const;

  std::uint64_t TotalRegistered() const;
  std::uint64_t TotalReleased() const;

 private:
  std::optional<gateway::DocumentHandle> Take(std::uint64_t handle_id);

  gateway::CloudDocumentGatewayPtr gateway_;

  mutable std::mutex mutex_;

  std::unordered_map<std::uint64_t, gateway::DocumentHandle>    open_;
  std::unordered_multimap<model::ModelIdentity, std::uint64_t> by_model_;

  std::uint64_t registered_{0};
  std::uint64_t released_{0};
};

/*
  Scope guard: registers on construction, releases on destruction.
*/
class ScopedDocument {
 public:
  ScopedDocument(ResourceLedger& ledger, gateway::DocumentHandle handle);
  ~ScopedDocument();

  ScopedDocument(const ScopedDocument&)            = delete;
  ScopedDocument& operator=(const ScopedDocument&) = delete;

  const gateway::DocumentHandle& handle() const {
    return handle_;
  }

 private:
  ResourceLedger&         ledger_;
  gateway::DocumentHandle handle_;
};

} // namespace linksync::ledger
