#pragma once

// docsync/observability.hpp — Structured logging and run statistics.
//
// DESIGN:
//   LogEvent is the canonical observable unit. Every local recovery that
//   discards external data (sanitizer failures, rejected bulk responses,
//   rejected scopes) emits one warning-level LogEvent carrying the error type
//   and the stage, so the recovery can be audited later. Events are:
//     - written to stderr as "<LEVEL> [docsync] <message> (key=value, ...)";
//     - appended as JSONL to DOCSYNC_EVENT_LOG when that variable is set;
//     - or, when a hook is registered, handed to the hook instead (tests).
//
// INVARIANT: emission never throws and never blocks on anything other than
// the stderr/file write itself.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include "docsync/jsonlite.hpp"

namespace docsync {

enum class LogLevel { info, warning, error };

std::string to_string(LogLevel level);

struct LogEvent {
  LogLevel level{LogLevel::info};
  std::string message;
  std::string stage;       // e.g. "claim_text", "docsync_pack", "evidence"
  std::string error_type;  // e.g. "SanitizerFailure", "StructuralDecodeError"
  std::string document;    // doc path from the manifest, if any
  std::string detail;
};

std::string log_event_to_json(const LogEvent& ev);

void emit_log_event(const LogEvent& ev);

inline void log_warning(std::string message, std::string stage = "",
                        std::string error_type = "", std::string document = "",
                        std::string detail = "") {
  emit_log_event(LogEvent{LogLevel::warning, std::move(message), std::move(stage),
                          std::move(error_type), std::move(document), std::move(detail)});
}

// Hook registration. A registered hook replaces the stderr/file sinks.
using LogEventHook = void (*)(const LogEvent&);
void set_log_event_hook(LogEventHook hook);

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
// Used for redaction call latency, which is dominated by network round trips.
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // Approximate percentile in microseconds. p in [0.0, 1.0].
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  jsonlite::Object to_object() const;
  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// RunStats — counters for one runner instance
// ---------------------------------------------------------------------------
// Thread-safe: every counter is atomic, so concurrent document workers update
// them without coordination.
struct RunStats {
  std::atomic<uint64_t> documents_processed{0};
  std::atomic<uint64_t> documents_aborted{0};
  std::atomic<uint64_t> claims_pass{0};
  std::atomic<uint64_t> claims_fail{0};
  std::atomic<uint64_t> claims_skip{0};
  std::atomic<uint64_t> sanitizer_calls{0};
  std::atomic<uint64_t> sanitizer_failures{0};
  std::atomic<uint64_t> sanitizer_degraded{0};
  LatencyHistogram sanitizer_latency;

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// ScopeTimer — RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  LatencyHistogram& histogram;
  explicit ScopeTimer(LatencyHistogram& h) : histogram(h) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    histogram.record(static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count()));
  }
};

}  // namespace docsync
