#include "memory_gateway.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace linksync::gateway::memory {

namespace obs = linksync::observability;

using model::ErrorKind;
using model::ModelIdentity;

namespace {

[[noreturn]] void Raise(ErrorKind kind, const std::string& message) {
  switch (kind) {
    case ErrorKind::kNotFound:
      throw util::NotFound(message);
    case ErrorKind::kAccessDenied:
      throw util::AccessDenied(message);
    case ErrorKind::kLocked:
      throw util::Locked(message);
    case ErrorKind::kTransientIO:
      throw util::TransientIO(message);
    case ErrorKind::kSyncConflict:
      throw util::SyncConflict(message);
    case ErrorKind::kCorruptModel:
      throw util::CorruptModel(message);
    case ErrorKind::kGatewayUnavailable:
      throw util::GatewayUnavailable(message);
    case ErrorKind::kCycleDetected:
    case ErrorKind::kInternal:
      break;
  }
  throw std::runtime_error(message);
}

} // namespace

std::string_view ToString(Operation operation) {
  switch (operation) {
    case Operation::kOpenDetached:
      return "open_detached";
    case Operation::kOpenFull:
      return "open_full";
    case Operation::kReadLinks:
      return "read_links";
    case Operation::kApplyOptions:
      return "apply_options";
    case Operation::kSync:
      return "sync";
  }
  return "unknown";
}

Operation ParseOperation(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  for (auto operation : {Operation::kOpenDetached, Operation::kOpenFull, Operation::kReadLinks, Operation::kApplyOptions, Operation::kSync}) {
    if (ToString(operation) == lowered) return operation;
  }
  throw std::invalid_argument("unknown gateway operation: " + std::string(text));
}

MemoryGateway::MemoryGateway() = default;

void MemoryGateway::AddModel(const ModelIdentity& id, std::string name, std::vector<std::string> worksets) {
  std::lock_guard lock(mutex_);
  auto&           record = models_[id];
  record.name            = std::move(name);
  record.worksets        = std::move(worksets);
}

void MemoryGateway::AddLink(const ModelIdentity& parent, const ModelIdentity& child, std::string name) {
  std::lock_guard lock(mutex_);

  auto it = models_.find(parent);
  if (it == models_.end()) {
    throw util::NotFound("memory gateway: cannot link from unknown model " + parent.ToString());
  }

  if (name.empty()) {
    auto child_it = models_.find(child);
    name          = child_it != models_.end() ? child_it->second.name : child.ShortName();
  }
  it->second.links.push_back(ModelLink{child, std::move(name)});
}

void MemoryGateway::AddUnresolvedLink(const ModelIdentity& parent, std::string description) {
  std::lock_guard lock(mutex_);

  auto it = models_.find(parent);
  if (it == models_.end()) {
    throw util::NotFound("memory gateway: cannot link from unknown model " + parent.ToString());
  }
  it->second.unresolved.push_back(std::move(description));
}

void MemoryGateway::InjectFault(const ModelIdentity& id, Operation operation, ErrorKind kind, std::uint32_t times, std::string message) {
  std::lock_guard lock(mutex_);
  if (message.empty()) {
    message = std::string(model::ToString(kind)) + " on " + std::string(ToString(operation)) + " of " + id.ToString();
  }
  faults_.insert_or_assign(FaultKey{id, operation}, Fault{kind, times, times == 0, std::move(message)});
}

void MemoryGateway::ClearFaults() {
  std::lock_guard lock(mutex_);
  faults_.clear();
}

void MemoryGateway::SetUnavailable(bool unavailable) {
  std::lock_guard lock(mutex_);
  unavailable_ = unavailable;
}

void MemoryGateway::SetLatency(std::chrono::milliseconds latency) {
  std::lock_guard lock(mutex_);
  latency_ = latency;
}

bool MemoryGateway::HasModel(const ModelIdentity& id) const {
  std::lock_guard lock(mutex_);
  return models_.count(id) > 0;
}

std::string MemoryGateway::NameOf(const ModelIdentity& id) const {
  std::lock_guard lock(mutex_);
  auto            it = models_.find(id);
  return it == models_.end() ? std::string() : it->second.name;
}

std::size_t MemoryGateway::ModelCount() const {
  std::lock_guard lock(mutex_);
  return models_.size();
}

void MemoryGateway::Pause() const {
  std::chrono::milliseconds latency;
  {
    std::lock_guard lock(mutex_);
    latency = latency_;
  }
  if (latency.count() > 0) {
    std::this_thread::sleep_for(latency);
  }
}

void MemoryGateway::CheckFaultLocked(const ModelIdentity& id, Operation operation) {
  ++calls_[FaultKey{id, operation}];

  if (unavailable_) {
    throw util::GatewayUnavailable("cloud host unreachable");
  }

  auto it = faults_.find(FaultKey{id, operation});
  if (it == faults_.end()) return;

  auto fault = it->second;
  if (!fault.permanent) {
    if (--it->second.remaining == 0) {
      faults_.erase(it);
    }
  }
  Raise(fault.kind, fault.message);
}

const DocumentHandle& MemoryGateway::RequireOpenLocked(const DocumentHandle& handle) const {
  auto it = open_.find(handle.id);
  if (it == open_.end()) {
    throw util::NotFound("memory gateway: document handle " + std::to_string(handle.id) + " is not open");
  }
  return it->second;
}

DocumentHandle MemoryGateway::Open(const ModelIdentity& id, OpenMode mode, Operation operation) {
  Pause();

  std::lock_guard lock(mutex_);
  CheckFaultLocked(id, operation);

  if (!models_.count(id)) {
    throw util::NotFound("model not found in cloud: " + id.ToString());
  }

  DocumentHandle handle{next_handle_++, id, mode};
  open_.emplace(handle.id, handle);
  ++total_opens_;
  ++opens_[{id, mode}];

  const auto in_mode = static_cast<std::size_t>(
      std::count_if(open_.begin(), open_.end(), [mode](const auto& entry) { return entry.second.mode == mode; }));
  auto& peak = mode == OpenMode::kFull ? peak_full_ : peak_detached_;
  peak       = std::max(peak, in_mode);

  return handle;
}

DocumentHandle MemoryGateway::OpenDetached(const ModelIdentity& id) {
  return Open(id, OpenMode::kDetached, Operation::kOpenDetached);
}

DocumentHandle MemoryGateway::OpenFull(const ModelIdentity& id) {
  return Open(id, OpenMode::kFull, Operation::kOpenFull);
}

LinkScan MemoryGateway::ReadDirectLinks(const DocumentHandle& handle) {
  std::lock_guard lock(mutex_);
  const auto&     open = RequireOpenLocked(handle);
  CheckFaultLocked(open.identity, Operation::kReadLinks);

  const auto& record = models_.at(open.identity);
  return LinkScan{record.links, record.unresolved};
}

model::ApplyOutcome MemoryGateway::ApplyOptions(const DocumentHandle& handle, const DocumentOptions& options) {
  std::lock_guard lock(mutex_);
  const auto&     open = RequireOpenLocked(handle);
  CheckFaultLocked(open.identity, Operation::kApplyOptions);

  if (open.mode != OpenMode::kFull) {
    throw util::AccessDenied("run options need a full open: " + open.identity.ToString());
  }

  const auto&         record = models_.at(open.identity);
  model::ApplyOutcome outcome;

  const auto total = static_cast<std::uint32_t>(record.worksets.size());
  switch (options.workset_mode) {
    case WorksetOpeningMode::kAll:
      outcome.worksets_opened = total;
      break;
    case WorksetOpeningMode::kLastViewed:
      outcome.worksets_opened = total > 0 ? 1 : 0;
      break;
    case WorksetOpeningMode::kSpecify:
      outcome.worksets_opened = static_cast<std::uint32_t>(std::count_if(record.worksets.begin(), record.worksets.end(), [&](const std::string& w) {
        return std::find(options.worksets.begin(), options.worksets.end(), w) != options.worksets.end();
      }));
      break;
  }
  outcome.worksets_still_closed = total - outcome.worksets_opened;

  if (options.reload_links) {
    for (const auto& link : record.links) {
      if (models_.count(link.identity)) {
        ++outcome.links_reloaded;
      } else {
        ++outcome.link_failures;
      }
    }
  }

  return outcome;
}

void MemoryGateway::Sync(const DocumentHandle& handle) {
  Pause();

  std::lock_guard lock(mutex_);
  const auto&     open = RequireOpenLocked(handle);
  CheckFaultLocked(open.identity, Operation::kSync);

  if (open.mode != OpenMode::kFull) {
    throw util::AccessDenied("detached documents cannot sync with central: " + open.identity.ToString());
  }

  sync_log_.push_back(SyncRecord{open.identity, util::Now()});
}

void MemoryGateway::Close(const DocumentHandle& handle) noexcept {
  std::lock_guard lock(mutex_);

  if (open_.erase(handle.id) == 0) {
    ++redundant_closes_;
    LINKSYNC_LOG_DEBUG("Close of a document that is not open", {obs::IntField("handle", static_cast<std::int64_t>(handle.id))});
    return;
  }
  ++total_closes_;
}

std::uint64_t MemoryGateway::OpenCount(const ModelIdentity& id, OpenMode mode) const {
  std::lock_guard lock(mutex_);
  auto            it = opens_.find({id, mode});
  return it == opens_.end() ? 0 : it->second;
}

std::uint64_t MemoryGateway::TotalOpens() const {
  std::lock_guard lock(mutex_);
  return total_opens_;
}

std::uint64_t MemoryGateway::TotalCloses() const {
  std::lock_guard lock(mutex_);
  return total_closes_;
}

std::uint64_t MemoryGateway::RedundantCloses() const {
  std::lock_guard lock(mutex_);
  return redundant_closes_;
}

std::size_t MemoryGateway::OpenHandles() const {
  std::lock_guard lock(mutex_);
  return open_.size();
}

std::size_t MemoryGateway::PeakOpenHandles(OpenMode mode) const {
  std::lock_guard lock(mutex_);
  return mode == OpenMode::kFull ? peak_full_ : peak_detached_;
}

std::uint64_t MemoryGateway::SyncCount(const ModelIdentity& id) const {
  std::lock_guard lock(mutex_);
  return static_cast<std::uint64_t>(std::count_if(sync_log_.begin(), sync_log_.end(), [&](const SyncRecord& r) { return r.identity == id; }));
}

std::vector<SyncRecord> MemoryGateway::SyncLog() const {
  std::lock_guard lock(mutex_);
  return sync_log_;
}

std::uint64_t MemoryGateway::CallCount(const ModelIdentity& id, Operation operation) const {
  std::lock_guard lock(mutex_);
  auto            it = calls_.find(FaultKey{id, operation});
  return it == calls_.end() ? 0 : it->second;
}

} // namespace linksync::gateway::memory
