#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace waypoint::runtime::config {
class RuntimeConfig;
}

namespace waypoint::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"waypoint"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const OtlpConfig& config = {});
bool InitializeTracing(const waypoint::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  Span around one store operation.

  Without WAYPOINT_ENABLE_OTEL every member is an inline no-op.
*/
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
#ifdef WAYPOINT_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef WAYPOINT_ENABLE_OTEL
inline bool InitializeTracing(const OtlpConfig&) {
  return false;
}

inline bool InitializeTracing(const waypoint::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
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
#endif

// Span for one saver call, tagged with the backend and the thread it touches.
inline SpanScope StoreSpan(std::string_view backend, std::string_view operation, std::string_view thread_id = {}) {
  SpanScope span(std::string(backend) + "." + std::string(operation));
  span.SetAttribute("db.system", backend);
  if (!thread_id.empty()) {
    span.SetAttribute("waypoint.thread_id", thread_id);
  }
  return span;
}

} // namespace waypoint::observability
