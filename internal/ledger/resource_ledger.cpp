#include "internal/ledger/resource_ledger.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace linksync::ledger {

namespace obs = linksync::observability;

ResourceLedger::ResourceLedger(gateway::CloudDocumentGatewayPtr gateway) : gateway_(std::move(gateway)) {
}

ResourceLedger::~ResourceLedger() {
  const auto leaked = Drain();
  if (leaked > 0) {
    LINKSYNC_LOG_WARN("Ledger closed documents left open at teardown", {obs::IntField("count", static_cast<std::int64_t>(leaked))});
  }
}

void ResourceLedger::Register(const gateway::DocumentHandle& handle) {
  std::size_t open_count = 0;
  {
    std::lock_guard lock(mutex_);

    if (auto existing = open_.find(handle.id); existing != open_.end()) {
      auto range = by_model_.equal_range(existing->second.identity);
      for (auto it = range.first; it != range.second; ++it) {
        if (it->second == handle.id) {
          by_model_.erase(it);
          break;
        }
      }
      open_.erase(existing);
    } else {
      ++registered_;
    }

    open_.emplace(handle.id, handle);
    by_model_.emplace(handle.identity, handle.id);
    open_count = open_.size();
  }
  obs::Metrics::Instance().SetOpenHandles(open_count);
}

std::optional<gateway::DocumentHandle> ResourceLedger::Take(std::uint64_t handle_id) {
  std::lock_guard lock(mutex_);

  auto it = open_.find(handle_id);
  if (it == open_.end()) return std::nullopt;

  auto range = by_model_.equal_range(it->second.identity);
  for (auto i = range.first; i != range.second; ++i) {
    if (i->second == handle_id) {
      by_model_.erase(i);
      break;
    }
  }

  auto handle = std::move(it->second);
  open_.erase(it);
  ++released_;
  return handle;
}

bool ResourceLedger::Release(std::uint64_t handle_id) {
  auto handle = Take(handle_id);
  if (!handle) return false;

  gateway_->Close(*handle);
  obs::Metrics::Instance().SetOpenHandles(OpenCount());
  return true;
}

std::size_t ResourceLedger::Drain() {
  std::vector<gateway::DocumentHandle> handles;
  {
    std::lock_guard lock(mutex_);
    handles.reserve(open_.size());
    for (auto& [id, handle] : open_) {
      handles.push_back(std::move(handle));
    }
    released_ += open_.size();
    open_.clear();
    by_model_.clear();
  }

  for (const auto& handle : handles) {
    LINKSYNC_LOG_WARN("Closing document still held by ledger",
                      {obs::StringField("model", handle.identity.ToString()), obs::StringField("mode", gateway::ToString(handle.mode))});
    gateway_->Close(handle);
  }

  obs::Metrics::Instance().SetOpenHandles(0);
  return handles.size();
}

std::size_t ResourceLedger::OpenCount() const {
  std::lock_guard lock(mutex_);
  return open_.size();
}

bool ResourceLedger::Holds(std::uint64_t handle_id) const {
  std::lock_guard lock(mutex_);
  return open_.count(handle_id) > 0;
}

bool ResourceLedger::HoldsModel(const model::ModelIdentity& id) const {
  std::lock_guard lock(mutex_);
  return by_model_.count(id) > 0;
}

std::uint64_t ResourceLedger::TotalRegistered() const {
  std::lock_guard lock(mutex_);
  return registered_;
}

std::uint64_t ResourceLedger::TotalReleased() const {
  std::lock_guard lock(mutex_);
  return released_;
}

ScopedDocument::ScopedDocument(ResourceLedger& ledger, gateway::DocumentHandle handle) : ledger_(ledger), handle_(std::move(handle)) {
  ledger_.Register(handle_);
}

ScopedDocument::~ScopedDocument() {
  ledger_.Release(handle_.id);
}

} // namespace linksync::ledger
