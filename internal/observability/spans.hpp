#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace linksync::runtime::config {
class RuntimeConfig;
}

namespace linksync::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"linksync"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const linksync::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const linksync::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef LINKSYNC_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordModelOpen(std::string_view mode, bool success);
  void RecordRetry(std::string_view step);
  void ObserveTaskDurationMs(std::string_view outcome, double duration_ms);
  void SetOpenHandles(std::uint64_t count);

 private:
  Metrics();
#ifdef LINKSYNC_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef LINKSYNC_ENABLE_OTEL
inline bool InitializeTracing(const linksync::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const linksync::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordModelOpen(std::string_view, bool) {
}

inline void Metrics::RecordRetry(std::string_view) {
}

inline void Metrics::ObserveTaskDurationMs(std::string_view, double) {
}

inline void Metrics::SetOpenHandles(std::uint64_t) {
}
#endif

} // namespace linksync::observability
