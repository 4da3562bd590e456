#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace ticketflow::runtime::config {
class RuntimeConfig;
}

namespace ticketflow::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"ticketflow"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const OtlpConfig& config = {});
bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeTracing(const ticketflow::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const ticketflow::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// True when the binary was built with OTLP export.
constexpr bool OtelCompiledIn() {
#ifdef TICKETFLOW_ENABLE_OTEL
  return true;
#else
  return false;
#endif
}

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
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef TICKETFLOW_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Pipeline counters.

  pages:  outcome = committed | review | duplicate | error
  files:  status  = FileStatus name; retries counted separately
  runs:   status  = RunStatus name
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordPage(std::string_view outcome);
  void RecordFile(std::string_view status, int attempts);
  void ObserveFileDurationMs(double duration_ms);
  void RecordRollback(bool success);
  void RecordRun(std::string_view status, double duration_ms);

 private:
  Metrics();
#ifdef TICKETFLOW_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef TICKETFLOW_ENABLE_OTEL
inline bool InitializeTracing(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeTracing(const ticketflow::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const ticketflow::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::SetAttribute(std::string_view, double) {
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

inline void Metrics::RecordPage(std::string_view) {
}

inline void Metrics::RecordFile(std::string_view, int) {
}

inline void Metrics::ObserveFileDurationMs(double) {
}

inline void Metrics::RecordRollback(bool) {
}

inline void Metrics::RecordRun(std::string_view, double) {
}
#endif

} // namespace ticketflow::observability
