#include "docsync/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <mutex>

#include "docsync/jsonlite.hpp"

namespace docsync {

namespace {

std::atomic<LogEventHook> g_log_hook{nullptr};
std::mutex g_stderr_mu;

// MICRO_OPT: bit_width gives the bucket index in O(1) (BSR/CLZ).
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::string format_line(const LogEvent& ev) {
  std::string line;
  line.reserve(128);
  line += ev.level == LogLevel::warning ? "WARNING" : ev.level == LogLevel::error ? "ERROR" : "INFO";
  line += " [docsync] ";
  line += ev.message;
  std::string ctx;
  const auto add = [&ctx](const char* key, const std::string& value) {
    if (value.empty()) return;
    if (!ctx.empty()) ctx += ", ";
    ctx += key;
    ctx += '=';
    ctx += value;
  };
  add("stage", ev.stage);
  add("error_type", ev.error_type);
  add("document", ev.document);
  add("detail", ev.detail);
  if (!ctx.empty()) line += " (" + ctx + ")";
  return line;
}

}  // namespace

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::info: return "info";
    case LogLevel::warning: return "warning";
    case LogLevel::error: return "error";
  }
  return "info";
}

std::string log_event_to_json(const LogEvent& ev) {
  jsonlite::Object obj;
  obj["level"] = to_string(ev.level);
  obj["message"] = ev.message;
  obj["stage"] = ev.stage;
  obj["error_type"] = ev.error_type;
  obj["document"] = ev.document;
  obj["detail"] = ev.detail;
  return jsonlite::to_json(jsonlite::Value{std::move(obj)});
}

void emit_log_event(const LogEvent& ev) {
  LogEventHook hook = g_log_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  {
    std::lock_guard<std::mutex> lk(g_stderr_mu);
    std::cerr << format_line(ev) << "\n";
  }

  // Activation: DOCSYNC_EVENT_LOG=/path/to/events.jsonl
  const char* log_path = std::getenv("DOCSYNC_EVENT_LOG");
  if (!log_path || !log_path[0]) return;
  const std::string line = log_event_to_json(ev) + "\n";
  // O_APPEND writes below PIPE_BUF are atomic on POSIX.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

void set_log_event_hook(LogEventHook hook) {
  g_log_hook.store(hook, std::memory_order_release);
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double bucket_lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double bucket_hi = static_cast<double>(1ULL << i);
      return (bucket_lo + bucket_hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

jsonlite::Object LatencyHistogram::to_object() const {
  jsonlite::Object obj;
  obj["count"] = count();
  obj["sum_us"] = sum_us_.load(std::memory_order_relaxed);
  obj["p50_us"] = percentile(0.50);
  obj["p95_us"] = percentile(0.95);
  obj["p99_us"] = percentile(0.99);
  return obj;
}

std::string LatencyHistogram::to_json() const {
  return jsonlite::to_json(jsonlite::Value{to_object()});
}

std::string RunStats::to_json() const {
  jsonlite::Object obj;
  obj["documents_processed"] = documents_processed.load();
  obj["documents_aborted"] = documents_aborted.load();
  obj["claims_pass"] = claims_pass.load();
  obj["claims_fail"] = claims_fail.load();
  obj["claims_skip"] = claims_skip.load();
  obj["sanitizer_calls"] = sanitizer_calls.load();
  obj["sanitizer_failures"] = sanitizer_failures.load();
  obj["sanitizer_degraded"] = sanitizer_degraded.load();
  obj["sanitizer_latency"] = sanitizer_latency.to_object();
  return jsonlite::to_json(jsonlite::Value{std::move(obj)});
}

}  // namespace docsync
